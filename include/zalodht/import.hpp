#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <json/value.h>
#include <zalodht/container.hpp>
#include <zalodht/defs.h>

namespace zalodht {

class dht_store;
class name_resolver;

struct import_stats {
	size_t conversations = 0, messages = 0, attachments = 0, blobs = 0;
	size_t replies = 0, ignored = 0;
};

/**
 * @account:	AccountId (top-level directory of the backup)
 * @media_root:	<outdir>/<account>/<downloads dir>
 */
struct import_context {
	dht_store &store;
	name_resolver &names;
	std::string account, media_root;
	import_stats stats;
};

/*
 * Feed each non-blank line of an NDJSON file to @f, inside a write
 * transaction of its own that is committed before the next line is read.
 */
extern ZD_EXPORT size_t zd_ndjson_foreach(dht_store &, const char *path, const std::function<void(const Json::Value &)> &f);
extern ZD_EXPORT void zd_import_conversations(import_context &, const char *path);
extern ZD_EXPORT void zd_import_messages(import_context &, const char *path);

struct zbk_import_param {
	std::string passphrase, container, database;
	/* optional Index.db for display names */
	std::string index, index_cipher_compat;
	/* empty: ZaloDownloads if present, else Downloads */
	std::string downloads_dir;
	zbk_decrypt_param decrypt;
};

/*
 * Container in, DHT rows out. stage() names the step that was running
 * when run() threw.
 */
class ZD_EXPORT zbk_pipeline {
	public:
	zbk_pipeline(const zbk_import_param &p) : m_param(p) {}
	import_stats run();
	const char *stage() const { return m_stage; }
	const std::string &outdir() const { return m_outdir; }
	const std::string &account() const { return m_account; }

	private:
	const zbk_import_param &m_param;
	const char *m_stage = "init";
	std::string m_outdir, m_account;
};

}
