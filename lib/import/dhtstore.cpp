// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of zalodht.
#include <cstdint>
#include <string>
#include <string_view>
#include <sqlite3.h>
#include <zalodht/database.h>
#include <zalodht/dhtstore.hpp>
#include <zalodht/errors.hpp>
#include <zalodht/nameres.hpp>
#include <zalodht/util.hpp>

namespace zalodht {

/* zd_placeholder(name): 1 if @name is NULL or auto-generated */
static void sql_placeholder(sqlite3_context *ctx, int argc, sqlite3_value **argv)
{
	if (argc != 1 || sqlite3_value_type(argv[0]) == SQLITE_NULL) {
		sqlite3_result_int(ctx, 1);
		return;
	}
	auto s = reinterpret_cast<const char *>(sqlite3_value_text(argv[0]));
	auto z = sqlite3_value_bytes(argv[0]);
	sqlite3_result_int(ctx, s == nullptr ||
		is_placeholder_name(std::string_view(s, z)));
}

#define NAME_UPGRADE(t) \
	" ON CONFLICT(id) DO UPDATE SET name=excluded.name" \
	" WHERE zd_placeholder(" t ".name) AND NOT zd_placeholder(excluded.name)"

void dht_store::open(const char *path)
{
	sqlite3 *db = nullptr;
	auto ret = sqlite3_open_v2(path, &db, SQLITE_OPEN_READWRITE, nullptr);
	m_db.reset(db);
	if (ret != SQLITE_OK)
		throw store_error("ZD-1401: sqlite3_open %s: %s", path,
		      db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(ret));
	sqlite3_busy_timeout(db, 5000);

	/* Schema belongs to DHT; only accept a database it has initialized. */
	auto stm = zd_sql_prep(db, "SELECT value FROM metadata WHERE key='version'",
	           SQLEXEC_SILENT_ERROR);
	if (stm == nullptr || stm.step() != SQLITE_ROW)
		throw store_error("ZD-1402: %s: database is not initialized "
		      "(no metadata version); let DHT create it first", path);
	mlog(LV_INFO, "dht: %s has schema version %s", path, znul(stm.col_text(0)));
	stm.finalize();

	if (sqlite3_create_function_v2(db, "zd_placeholder", 1,
	    SQLITE_UTF8 | SQLITE_DETERMINISTIC, nullptr, sql_placeholder,
	    nullptr, nullptr, nullptr) != SQLITE_OK)
		throw store_error("ZD-1403: %s: %s", path, sqlite3_errmsg(db));

	struct {
		xstmt &stm;
		const char *query;
	} const prep[] = {
		{m_server, "INSERT INTO servers (id, name, type) VALUES (?1, ?2, ?3)"
		           NAME_UPGRADE("servers")},
		{m_channel, "INSERT INTO channels (id, server, name) VALUES (?1, ?2, ?3)"
		            NAME_UPGRADE("channels")},
		{m_user, "INSERT INTO users (id, name, display_name, avatar_url, discriminator) "
		         "VALUES (?1, ?2, NULL, NULL, NULL)" NAME_UPGRADE("users")},
		{m_message, "INSERT INTO messages (message_id, sender_id, channel_id, text, timestamp) "
		            "VALUES (?1, ?2, ?3, ?4, ?5) ON CONFLICT DO NOTHING"},
		{m_attach, "INSERT INTO attachments (attachment_id, name, type, normalized_url, "
		           "download_url, size, width, height) VALUES (?1, ?2, ?3, ?4, ?4, ?5, ?6, ?7) "
		           "ON CONFLICT DO NOTHING"},
		/* link tables need not have a unique index */
		{m_msgattach, "INSERT INTO message_attachments (message_id, attachment_id) "
		              "SELECT ?1, ?2 WHERE NOT EXISTS (SELECT 1 FROM message_attachments "
		              "WHERE message_id=?1 AND attachment_id=?2) ON CONFLICT DO NOTHING"},
		{m_reply, "INSERT INTO message_replied_to (message_id, replied_to_id) "
		          "SELECT ?1, ?2 WHERE NOT EXISTS (SELECT 1 FROM message_replied_to "
		          "WHERE message_id=?1) ON CONFLICT DO NOTHING"},
		{m_dlmeta, "INSERT INTO download_metadata (normalized_url, download_url, status, type, size) "
		           "VALUES (?1, ?1, 200, ?2, ?3) ON CONFLICT DO NOTHING"},
		{m_dlblob, "INSERT INTO download_blobs (normalized_url, blob) VALUES (?1, ?2) "
		           "ON CONFLICT DO NOTHING"},
	};
	for (const auto &p : prep) {
		p.stm = zd_sql_prep(db, p.query);
		if (p.stm == nullptr)
			throw store_error("ZD-1404: %s: schema does not match: %s",
			      path, sqlite3_errmsg(db));
	}
}

#undef NAME_UPGRADE

xtransaction dht_store::begin()
{
	auto txn = zd_sql_begin(m_db.get());
	if (!txn)
		throw store_error("ZD-1405: BEGIN: %s", sqlite3_errmsg(m_db.get()));
	return txn;
}

void dht_store::run(xstmt &stm, const char *what)
{
	auto ret = stm.step();
	if (ret != SQLITE_DONE) {
		std::string err = sqlite3_errmsg(m_db.get());
		stm.reset();
		throw store_error("ZD-1406: %s: %s (%d)", what, err.c_str(), ret);
	}
	stm.reset();
}

void dht_store::put_server(int64_t id, const std::string &name, const char *type)
{
	m_server.bind_int64(1, id);
	m_server.bind_text(2, name);
	m_server.bind_text(3, type);
	run(m_server, "servers");
}

void dht_store::put_channel(int64_t id, int64_t server, const std::string &name)
{
	m_channel.bind_int64(1, id);
	m_channel.bind_int64(2, server);
	m_channel.bind_text(3, name);
	run(m_channel, "channels");
}

void dht_store::put_user(int64_t id, const std::string &name)
{
	m_user.bind_int64(1, id);
	m_user.bind_text(2, name);
	run(m_user, "users");
}

void dht_store::put_message(int64_t id, int64_t sender, int64_t channel,
    const std::string &text, int64_t ts)
{
	m_message.bind_int64(1, id);
	m_message.bind_int64(2, sender);
	m_message.bind_int64(3, channel);
	m_message.bind_text(4, text);
	m_message.bind_int64(5, ts);
	run(m_message, "messages");
}

void dht_store::put_attachment(const dht_attachment &a)
{
	m_attach.bind_int64(1, a.id);
	m_attach.bind_text(2, a.name);
	m_attach.bind_text(3, a.type);
	m_attach.bind_text(4, a.url);
	m_attach.bind_int64(5, a.size);
	if (a.width.has_value())
		m_attach.bind_int64(6, *a.width);
	else
		m_attach.bind_null(6);
	if (a.height.has_value())
		m_attach.bind_int64(7, *a.height);
	else
		m_attach.bind_null(7);
	run(m_attach, "attachments");
}

void dht_store::put_msg_attachment(int64_t msg, int64_t att)
{
	m_msgattach.bind_int64(1, msg);
	m_msgattach.bind_int64(2, att);
	run(m_msgattach, "message_attachments");
}

void dht_store::put_reply(int64_t msg, int64_t replied_to)
{
	m_reply.bind_int64(1, msg);
	m_reply.bind_int64(2, replied_to);
	run(m_reply, "message_replied_to");
}

/* Metadata goes first; download_blobs refers to it. */
void dht_store::put_download(const std::string &url, const char *type,
    const void *blob, size_t size)
{
	m_dlmeta.bind_text(1, url);
	m_dlmeta.bind_text(2, type);
	m_dlmeta.bind_int64(3, size);
	run(m_dlmeta, "download_metadata");
	m_dlblob.bind_text(1, url);
	m_dlblob.bind_blob(2, blob, size);
	run(m_dlblob, "download_blobs");
}

}
