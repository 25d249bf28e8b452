// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2022–2026 grommunio GmbH
// This file is part of zalodht.
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <json/reader.h>
#include <json/writer.h>
#include <zalodht/json.hpp>
#include <zalodht/util.hpp>

namespace zalodht {

bool str_to_json(std::string_view sv, Json::Value &jv)
{
	Json::CharReaderBuilder b;
	/* one document per call: no comments, nothing after the value */
	b["allowComments"] = false;
	b["failIfExtra"]   = true;
	using reader_t = decltype(b.newCharReader());
	std::unique_ptr<std::remove_pointer_t<reader_t>> rd(b.newCharReader());
	return rd->parse(sv.data(), sv.data() + sv.size(), &jv, nullptr);
}

std::string json_to_str(const Json::Value &jv)
{
	Json::StreamWriterBuilder swb;
	swb["indentation"] = "";
	return Json::writeString(swb, jv);
}

/**
 * Zalo writes ids and times both as JSON numbers and as decimal strings.
 * Accept either; anything else (including fractions) is rejected.
 */
bool json_get_int64(const Json::Value &jv, int64_t &out)
{
	if (jv.isString())
		return parse_decimal_id(jv.asString(), out);
	if (jv.isInt64()) {
		out = jv.asInt64();
		return true;
	}
	if (jv.isUInt64() || !jv.isIntegral())
		return false;
	out = jv.asInt64();
	return true;
}

/* Id in string form, as Zalo's own path and prefix conventions expect. */
std::string json_get_idstr(const Json::Value &jv)
{
	if (jv.isString())
		return jv.asString();
	if (jv.isInt64())
		return std::to_string(jv.asInt64());
	if (jv.isUInt64())
		return std::to_string(jv.asUInt64());
	return {};
}

}
