#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <zalodht/database.h>
#include <zalodht/defs.h>

namespace zalodht {

struct dht_attachment {
	int64_t id = 0;
	std::string name, type, url;
	uint64_t size = 0;
	std::optional<int64_t> width, height;
};

/**
 * Writer for a DHT database that some other program has already created.
 *
 * Server, channel and user names are only ever upgraded from a placeholder
 * to a real name. All other rows are written once; later duplicates are
 * ignored. Every put_* throws store_error when SQLite fails.
 */
class ZD_EXPORT dht_store {
	public:
	dht_store() = default;
	NOMOVE(dht_store);
	void open(const char *path);
	xtransaction begin();

	void put_server(int64_t id, const std::string &name, const char *type);
	void put_channel(int64_t id, int64_t server, const std::string &name);
	void put_user(int64_t id, const std::string &name);
	void put_message(int64_t id, int64_t sender, int64_t channel, const std::string &text, int64_t ts);
	void put_attachment(const dht_attachment &);
	void put_msg_attachment(int64_t msg, int64_t att);
	void put_reply(int64_t msg, int64_t replied_to);
	void put_download(const std::string &url, const char *type, const void *blob, size_t size);

	private:
	void run(xstmt &, const char *what);

	std::unique_ptr<sqlite3, sqlite_delete> m_db;
	xstmt m_server, m_channel, m_user, m_message, m_attach, m_msgattach,
	      m_reply, m_dlmeta, m_dlblob;
};

}
