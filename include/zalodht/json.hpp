#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <json/value.h>
#include <zalodht/defs.h>
namespace zalodht {
extern ZD_EXPORT bool str_to_json(std::string_view, Json::Value &);
extern ZD_EXPORT std::string json_to_str(const Json::Value &);
extern ZD_EXPORT bool json_get_int64(const Json::Value &, int64_t &);
extern ZD_EXPORT std::string json_get_idstr(const Json::Value &);
}
