#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <zalodht/defs.h>

namespace zalodht {

extern ZD_EXPORT bool parse_bool(const char *s);
extern ZD_EXPORT std::string bin2hex(const void *, size_t);
template<typename T> std::string bin2hex(const T &x) { return bin2hex(&x, sizeof(x)); }
extern ZD_EXPORT bool parse_decimal_id(const std::string_view &, int64_t &);
extern ZD_EXPORT std::vector<std::string> zd_split(const std::string_view &, char sep);
extern ZD_EXPORT void mlog_init(const char *ident, const char *file, unsigned int level);
extern ZD_EXPORT void mlog(unsigned int level, const char *fmt, ...) __attribute__((format(printf, 2, 3)));
extern ZD_EXPORT unsigned int mlog_level();

}
