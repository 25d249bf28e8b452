// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2021-2026 grommunio GmbH
// This file is part of zalodht.
#include <sqlite3.h>
#include <unistd.h>
#include <zalodht/database.h>
#include <zalodht/util.hpp>

namespace zalodht {

unsigned int zd_sqlite_debug;

/* DHT may hold the database open while we import */
static constexpr unsigned int busy_retries = 10;

static void sql_complain(sqlite3 *db, const char *op, const char *query,
    const char *msg, int ret)
{
	if (msg == nullptr || *msg == '\0')
		msg = sqlite3_errstr(ret);
	mlog(LV_ERR, "%s(%s) \"%s\": %s (%d)", op,
		znul(db != nullptr ? sqlite3_db_filename(db, nullptr) : nullptr),
		znul(query), msg, ret);
}

xstmt zd_sql_prep(sqlite3 *db, const char *query, unsigned int flags)
{
	xstmt out;
	if (zd_sqlite_debug >= 1)
		mlog(LV_DEBUG, "> sqlite3_prep(%s)", query);
	auto ret = sqlite3_prepare_v2(db, query, -1, &out.m_ptr, nullptr);
	if (ret != SQLITE_OK && !(flags & SQLEXEC_SILENT_ERROR))
		sql_complain(db, "sqlite3_prepare_v2", query, sqlite3_errmsg(db), ret);
	return out;
}

xtransaction::~xtransaction()
{
	if (m_db != nullptr)
		zd_sql_exec(m_db, "ROLLBACK");
}

int xtransaction::commit()
{
	if (m_db == nullptr)
		return SQLITE_OK;
	auto ret = zd_sql_exec(m_db, "COMMIT", SQLEXEC_SILENT_ERROR);
	for (unsigned int i = 0; ret == SQLITE_BUSY && i < busy_retries; ++i) {
		if (i == 0)
			mlog(LV_NOTICE, "%s is busy, retrying COMMIT",
				znul(sqlite3_db_filename(m_db, nullptr)));
		sleep(1);
		ret = zd_sql_exec(m_db, "COMMIT", SQLEXEC_SILENT_ERROR);
	}
	if (ret != SQLITE_OK) {
		/* still open; the destructor rolls back */
		sql_complain(m_db, "sqlite3_exec", "COMMIT", sqlite3_errmsg(m_db), ret);
		return ret;
	}
	m_db = nullptr;
	return ret;
}

xtransaction zd_sql_begin(sqlite3 *db)
{
	if (zd_sql_exec(db, "BEGIN IMMEDIATE") != SQLITE_OK)
		return xtransaction(nullptr);
	return xtransaction(db);
}

int zd_sql_exec(sqlite3 *db, const char *query, unsigned int flags)
{
	char *estr = nullptr;
	if (zd_sqlite_debug >= 1)
		mlog(LV_DEBUG, "> sqlite3_exec(%s)", query);
	auto ret = sqlite3_exec(db, query, nullptr, nullptr, &estr);
	if (ret != SQLITE_OK && !(flags & SQLEXEC_SILENT_ERROR))
		sql_complain(db, "sqlite3_exec", query, estr, ret);
	sqlite3_free(estr);
	return ret;
}

int zd_sql_step(sqlite3_stmt *stm)
{
	auto ret = sqlite3_step(stm);
	auto failed = ret != SQLITE_ROW && ret != SQLITE_DONE;
	if (zd_sqlite_debug == 0 && !failed)
		return ret;
	auto exp = sqlite3_expanded_sql(stm);
	auto query = exp != nullptr ? exp : sqlite3_sql(stm);
	if (zd_sqlite_debug >= 1)
		mlog(LV_DEBUG, "> sqlite3_step(%s)", query);
	if (failed) {
		auto db = sqlite3_db_handle(stm);
		sql_complain(db, "sqlite3_step", query, sqlite3_errmsg(db), ret);
	}
	sqlite3_free(exp);
	return ret;
}

}
