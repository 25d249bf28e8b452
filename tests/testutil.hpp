#pragma once
/*
 * Fixture helpers for the test programs: DHT databases, tar archives and
 * encrypted containers are all generated at runtime.
 */
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>
#include <dirent.h>
#include <ftw.h>
#include <unistd.h>
#include <sys/stat.h>
#include <archive.h>
#include <archive_entry.h>
#include <openssl/evp.h>
#include <sqlite3.h>
#include <zalodht/cryptoutil.hpp>
#include <zalodht/database.h>

namespace zdtest {

static constexpr char dht_schema[] =
	"CREATE TABLE metadata (key TEXT NOT NULL PRIMARY KEY, value TEXT);"
	"CREATE TABLE servers (id INTEGER PRIMARY KEY NOT NULL, name TEXT NOT NULL, type TEXT NOT NULL);"
	"CREATE TABLE channels (id INTEGER PRIMARY KEY NOT NULL, server INTEGER NOT NULL, name TEXT NOT NULL,"
	" parent_id INTEGER, position INTEGER, topic TEXT, nsfw INTEGER);"
	"CREATE TABLE users (id INTEGER PRIMARY KEY NOT NULL, name TEXT NOT NULL, display_name TEXT,"
	" avatar_url TEXT, discriminator TEXT);"
	"CREATE TABLE messages (message_id INTEGER PRIMARY KEY NOT NULL, sender_id INTEGER NOT NULL,"
	" channel_id INTEGER NOT NULL, text TEXT NOT NULL, timestamp INTEGER NOT NULL);"
	"CREATE TABLE attachments (attachment_id INTEGER PRIMARY KEY NOT NULL, name TEXT NOT NULL, type TEXT,"
	" normalized_url TEXT NOT NULL, download_url TEXT, size INTEGER NOT NULL, width INTEGER, height INTEGER);"
	"CREATE TABLE message_attachments (message_id INTEGER NOT NULL, attachment_id INTEGER NOT NULL);"
	"CREATE TABLE message_replied_to (message_id INTEGER PRIMARY KEY NOT NULL, replied_to_id INTEGER NOT NULL);"
	"CREATE TABLE download_metadata (normalized_url TEXT NOT NULL PRIMARY KEY, download_url TEXT NOT NULL,"
	" status INTEGER NOT NULL, type TEXT, size INTEGER);"
	"CREATE TABLE download_blobs (normalized_url TEXT NOT NULL PRIMARY KEY, blob BLOB NOT NULL,"
	" FOREIGN KEY (normalized_url) REFERENCES download_metadata (normalized_url));";

/* mkdtemp-backed directory, removed recursively on destruction */
class tmpdir {
	public:
	tmpdir() {
		char tpl[] = "/tmp/zdtest-XXXXXX";
		if (mkdtemp(tpl) != nullptr)
			m_path = tpl;
	}
	~tmpdir() {
		if (!m_path.empty())
			nftw(m_path.c_str(), [](const char *f, const struct stat *, int, struct FTW *) {
				return remove(f);
			}, 16, FTW_DEPTH | FTW_PHYS);
	}
	bool ok() const { return !m_path.empty(); }
	std::string operator/(const std::string &rel) const { return m_path + "/" + rel; }
	const std::string &path() const { return m_path; }

	private:
	std::string m_path;
};

static inline bool write_file(const std::string &path, const std::string &data)
{
	auto fp = fopen(path.c_str(), "w");
	if (fp == nullptr)
		return false;
	auto ok = fwrite(data.data(), 1, data.size(), fp) == data.size();
	return fclose(fp) == 0 && ok;
}

static inline std::string read_file(const std::string &path)
{
	std::string out;
	auto fp = fopen(path.c_str(), "r");
	if (fp == nullptr)
		return out;
	char buf[4096];
	size_t rd;
	while ((rd = fread(buf, 1, sizeof(buf), fp)) > 0)
		out.append(buf, rd);
	fclose(fp);
	return out;
}

static inline bool file_exists(const std::string &path)
{
	return access(path.c_str(), F_OK) == 0;
}

/* number of entries in @dir, not counting "." and ".." */
static inline size_t dir_count(const std::string &dir)
{
	auto dh = opendir(dir.c_str());
	if (dh == nullptr)
		return 0;
	size_t n = 0;
	const struct dirent *de;
	while ((de = readdir(dh)) != nullptr)
		if (strcmp(de->d_name, ".") != 0 && strcmp(de->d_name, "..") != 0)
			++n;
	closedir(dh);
	return n;
}

/* A DHT database as DHT itself would have created it. */
static inline bool make_dht(const std::string &path, bool with_version = true)
{
	sqlite3 *db = nullptr;
	if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE |
	    SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
		sqlite3_close(db);
		return false;
	}
	std::unique_ptr<sqlite3, zalodht::sqlite_delete> hold(db);
	if (zalodht::zd_sql_exec(db, dht_schema) != SQLITE_OK)
		return false;
	return !with_version || zalodht::zd_sql_exec(db,
	       "INSERT INTO metadata (key, value) VALUES ('version', '9')") == SQLITE_OK;
}

static inline std::unique_ptr<sqlite3, zalodht::sqlite_delete> open_db(const std::string &path)
{
	sqlite3 *db = nullptr;
	if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE |
	    SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
		sqlite3_close(db);
		return nullptr;
	}
	return std::unique_ptr<sqlite3, zalodht::sqlite_delete>(db);
}

/* first column of the first row, "" if there is none */
static inline std::string q_text(sqlite3 *db, const char *query)
{
	auto stm = zalodht::zd_sql_prep(db, query);
	if (stm == nullptr || stm.step() != SQLITE_ROW)
		return {};
	auto s = stm.col_text(0);
	return s != nullptr ? s : "";
}

static inline int64_t q_int(sqlite3 *db, const char *query)
{
	auto stm = zalodht::zd_sql_prep(db, query);
	if (stm == nullptr || stm.step() != SQLITE_ROW)
		return -1;
	return stm.col_int64(0);
}

struct tar_ent {
	std::string name, data;
	unsigned int type = AE_IFREG;
	std::string link;
};

static inline bool tar_build(const std::string &path, const std::vector<tar_ent> &ents)
{
	auto a = archive_write_new();
	if (a == nullptr)
		return false;
	bool ok = archive_write_set_format_ustar(a) == ARCHIVE_OK &&
	          archive_write_open_filename(a, path.c_str()) == ARCHIVE_OK;
	for (const auto &e : ents) {
		if (!ok)
			break;
		auto ae = archive_entry_new();
		archive_entry_set_pathname(ae, e.name.c_str());
		archive_entry_set_filetype(ae, e.type);
		archive_entry_set_perm(ae, e.type == AE_IFDIR ? 0755 : 0644);
		archive_entry_set_mtime(ae, 1700000000, 0);
		if (e.type == AE_IFLNK)
			archive_entry_set_symlink(ae, e.link.c_str());
		if (e.type == AE_IFREG)
			archive_entry_set_size(ae, e.data.size());
		ok = archive_write_header(a, ae) == ARCHIVE_OK;
		if (ok && e.type == AE_IFREG && !e.data.empty())
			ok = archive_write_data(a, e.data.data(), e.data.size()) ==
			     static_cast<la_ssize_t>(e.data.size());
		archive_entry_free(ae);
	}
	if (archive_write_close(a) != ARCHIVE_OK)
		ok = false;
	archive_write_free(a);
	return ok;
}

/* AES-256-CBC without padding; @plain must be block-aligned */
static inline std::string zbk_encrypt(const std::string &plain, const zalodht::zbk_keysched &ks)
{
	std::unique_ptr<EVP_CIPHER_CTX, zalodht::sslfree> ctx(EVP_CIPHER_CTX_new());
	std::string out(plain.size() + 16, '\0');
	int len = 0, fin = 0;
	if (ctx == nullptr ||
	    EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, ks.key, ks.iv) <= 0 ||
	    EVP_CIPHER_CTX_set_padding(ctx.get(), 0) <= 0 ||
	    EVP_EncryptUpdate(ctx.get(), reinterpret_cast<unsigned char *>(out.data()), &len,
	    reinterpret_cast<const unsigned char *>(plain.data()), plain.size()) <= 0 ||
	    EVP_EncryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char *>(out.data()) + len, &fin) <= 0)
		return {};
	out.resize(len + fin);
	return out;
}

}
