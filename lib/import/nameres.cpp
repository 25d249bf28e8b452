// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of zalodht.
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/core.h>
#include <sqlite3.h>
#include <zalodht/database.h>
#include <zalodht/errors.hpp>
#include <zalodht/nameres.hpp>
#include <zalodht/util.hpp>

namespace zalodht {

conv_id conv_id::parse(const std::string_view &s)
{
	conv_id c;
	auto digits = s;
	if (!digits.empty() && digits[0] == 'g') {
		c.kind = conv_kind::group;
		digits.remove_prefix(1);
	}
	if (!parse_decimal_id(digits, c.id))
		throw format_error("ZD-1301: \"%.*s\" is not a Zalo id",
		      static_cast<int>(s.size()), s.data());
	return c;
}

std::string conv_id::placeholder() const
{
	return fmt::format("{} #{}", is_group() ? "Group" : "User", id);
}

/* "User #<digits>" or "Group #<digits>", and nothing else */
bool is_placeholder_name(const std::string_view &s)
{
	std::string_view rest;
	if (s.substr(0, 6) == "User #")
		rest = s.substr(6);
	else if (s.substr(0, 7) == "Group #")
		rest = s.substr(7);
	else
		return false;
	if (rest.empty())
		return false;
	for (auto c : rest)
		if (c < '0' || c > '9')
			return false;
	return true;
}

std::string display_name(name_resolver &res, const conv_id &id,
    const std::string_view &given)
{
	if (!given.empty())
		return std::string(given);
	auto name = res.lookup(id);
	if (name.has_value())
		return std::move(*name);
	return id.placeholder();
}

bool zd_sql_has_cipher(sqlite3 *db)
{
	auto stm = zd_sql_prep(db, "PRAGMA cipher_version", SQLEXEC_SILENT_ERROR);
	if (stm == nullptr || stm.step() != SQLITE_ROW)
		return false;
	auto v = stm.col_text(0);
	return v != nullptr && *v != '\0';
}

void index_resolver::open(const char *path, const std::string_view &pass,
    const char *cipher_compat)
{
	sqlite3 *db = nullptr;
	auto ret = sqlite3_open_v2(path, &db, SQLITE_OPEN_READONLY, nullptr);
	m_db.reset(db);
	if (ret != SQLITE_OK)
		throw store_error("ZD-1302: sqlite3_open %s: %s", path,
		      db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(ret));
	if (!pass.empty()) {
		/* stock sqlite ignores PRAGMA key and would only fail on first read */
		if (!zd_sql_has_cipher(m_db.get()))
			throw store_error("ZD-1310: %s: a passphrase was given, but this "
			      "build's sqlite has no SQLCipher support", path);
		std::unique_ptr<char[], sqlite_free> q(sqlite3_mprintf("PRAGMA key='%q'",
			std::string(pass).c_str()));
		/* not through zd_sql_exec; its debug trace would log the key */
		if (q == nullptr || sqlite3_exec(m_db.get(), q.get(), nullptr, nullptr, nullptr) != SQLITE_OK)
			throw store_error("ZD-1303: %s: cannot apply key", path);
		if (cipher_compat != nullptr && *cipher_compat != '\0') {
			auto cq = fmt::format("PRAGMA cipher_compatibility={}",
			          strtoul(cipher_compat, nullptr, 0));
			if (zd_sql_exec(m_db.get(), cq.c_str()) != SQLITE_OK)
				throw store_error("ZD-1304: %s: cannot set cipher compatibility", path);
		}
	}
	/* The first read is where a wrong key shows up. */
	if (zd_sql_exec(m_db.get(), "SELECT count(*) FROM sqlite_master") != SQLITE_OK)
		throw store_error("ZD-1305: %s: unreadable; wrong passphrase?", path);

	m_group = zd_sql_prep(m_db.get(), "SELECT displayName FROM \"group\" "
	          "WHERE userId=?1 OR userId=?2", SQLEXEC_SILENT_ERROR);
	m_friend = zd_sql_prep(m_db.get(), "SELECT displayName FROM friend "
	           "WHERE userId=?1", SQLEXEC_SILENT_ERROR);
	m_friends_info = zd_sql_prep(m_db.get(), "SELECT displayName FROM friends_info "
	                 "WHERE userId=?1", SQLEXEC_SILENT_ERROR);
	if (m_group == nullptr)
		mlog(LV_WARN, "W-1306: %s: no \"group\" table, group names unavailable", path);
	if (m_friend == nullptr)
		mlog(LV_WARN, "W-1307: %s: no \"friend\" table", path);
	if (m_friends_info == nullptr)
		mlog(LV_WARN, "W-1308: %s: no \"friends_info\" table", path);
}

std::optional<std::string> index_resolver::first_row(xstmt &stm, const conv_id &c)
{
	if (stm == nullptr)
		return std::nullopt;
	auto plain = std::to_string(c.id);
	auto gpfx  = "g" + plain;
	stm.reset();
	stm.bind_text(1, plain);
	if (sqlite3_bind_parameter_count(stm) >= 2)
		stm.bind_text(2, gpfx);
	std::optional<std::string> result;
	int ret;
	while ((ret = stm.step()) == SQLITE_ROW) {
		auto name = stm.col_text(0);
		if (name != nullptr && *name != '\0') {
			result.emplace(name);
			break;
		}
	}
	if (ret != SQLITE_ROW && ret != SQLITE_DONE)
		throw store_error("ZD-1309: index lookup for %lld failed",
		      static_cast<long long>(c.id));
	stm.reset();
	return result;
}

std::optional<std::string> index_resolver::lookup(const conv_id &c)
{
	if (c.is_group())
		return first_row(m_group, c);
	auto r = first_row(m_friend, c);
	if (r.has_value())
		return r;
	return first_row(m_friends_info, c);
}

}
