// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of zalodht.
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <unistd.h>
#include <sys/stat.h>
#include <zalodht/cryptoutil.hpp>
#include <zalodht/errors.hpp>
#include <zalodht/import.hpp>
#include "testutil.hpp"
#undef assert
#define assert(x) do { if (!(x)) { printf("%s failed\n", #x); return EXIT_FAILURE; } } while (false)
using namespace zalodht;
using namespace zdtest;

static int t_end_to_end(const tmpdir &td)
{
	auto tarfile = td / "plain.tar";
	assert(tar_build(tarfile, {
		{"12345/", {}, AE_IFDIR},
		{"12345/Downloads/", {}, AE_IFDIR},
		{"12345/Downloads/database/", {}, AE_IFDIR},
		{"12345/Downloads/database/12345_zconversation.zdb", "{\"userId\":\"g999\"}\n"},
		{"12345/Downloads/database/12345_zmessage.zdb",
		 "{\"cliMsgId\":1,\"fromUid\":\"7\",\"toUid\":\"g999\",\"dName\":\"\",\"msgType\":1,"
		 "\"message\":\"hi\",\"serverTime\":1000,\"quote\":null}\n"},
	}));
	auto cont = td / "backup.zaloenc";
	/* one suffix: zero IV */
	assert(write_file(cont, zbk_encrypt(read_file(tarfile), zbk_derive_key("p", "backup.zaloenc"))));
	auto dbpath = td / "dht.db";
	assert(make_dht(dbpath));
	assert(mkdir((td / "scratch").c_str(), 0700) == 0);

	zbk_import_param p;
	p.passphrase = "p";
	p.container  = cont;
	p.database   = dbpath;
	p.decrypt.tmpdir = td / "scratch";
	for (int pass = 0; pass < 2; ++pass) {
		zbk_pipeline pl(p);
		auto st = pl.run();
		assert(strcmp(pl.stage(), "done") == 0);
		assert(pl.outdir() == td / "backup");
		assert(pl.account() == "12345");
		assert(st.conversations == 1 && st.messages == 1);
	}
	/* scratch plaintext is gone */
	assert(dir_count(td / "scratch") == 0);
	assert(file_exists(td / "backup/12345/Downloads/database/12345_zmessage.zdb"));

	auto db = open_db(dbpath);
	auto d = db.get();
	assert(q_text(d, "SELECT id || '|' || name || '|' || type FROM servers") == "999|Group #999|GROUP");
	assert(q_text(d, "SELECT id || '|' || server || '|' || name FROM channels") == "999|999|Group #999");
	assert(q_text(d, "SELECT id || '|' || name FROM users") == "7|User #7");
	assert(q_text(d, "SELECT message_id || '|' || sender_id || '|' || channel_id || '|' || "
	       "text || '|' || timestamp FROM messages") == "1|7|999|hi|1000");
	assert(q_int(d, "SELECT COUNT(*) FROM servers") == 1);
	assert(q_int(d, "SELECT COUNT(*) FROM users") == 1);
	assert(q_int(d, "SELECT COUNT(*) FROM messages") == 1);
	return EXIT_SUCCESS;
}

#define PIC_URL "https://photo.zdn.vn/q/cat.png"

/*
 * Container reached through ".." and a symlinked directory, with media in
 * the newer ZaloDownloads layout.
 */
static int t_zalodownloads(const tmpdir &td)
{
	auto pic = "12345/ZaloDownloads/picture/7/z2_" + md5_hex(PIC_URL) + ".png";
	auto tarfile = td / "zd.tar";
	assert(tar_build(tarfile, {
		{"12345/", {}, AE_IFDIR},
		{"12345/ZaloDownloads/database/12345_zconversation.zdb", "{\"userId\":\"7\"}\n"},
		{"12345/ZaloDownloads/database/12345_zmessage.zdb",
		 "{\"cliMsgId\":2,\"fromUid\":\"7\",\"toUid\":\"7\",\"dName\":\"Alice\",\"msgType\":2,"
		 "\"message\":{\"href\":\"" PIC_URL "\"},\"serverTime\":2000}\n"},
		{pic, "PNGDATA"},
		/* a decoy that must not be picked */
		{"12345/Downloads/database/12345_zmessage.zdb", "not json\n"},
	}));
	assert(mkdir((td / "real").c_str(), 0755) == 0);
	assert(mkdir((td / "real/sub").c_str(), 0755) == 0);
	assert(symlink((td / "real").c_str(), (td / "link").c_str()) == 0);
	assert(write_file(td / "real/zd.zip.zaloenc", zbk_encrypt(read_file(tarfile),
	       zbk_derive_key("p", "zd.zip.zaloenc"))));
	auto dbpath = td / "dht-zd.db";
	assert(make_dht(dbpath));

	char cwd_before[4096], cwd_after[4096];
	assert(getcwd(cwd_before, sizeof(cwd_before)) != nullptr);
	zbk_import_param p;
	p.passphrase = "p";
	p.container  = td / "link/sub/../zd.zip.zaloenc";
	p.database   = dbpath;
	p.decrypt.tmpdir = td / "scratch";
	zbk_pipeline pl(p);
	auto st = pl.run();
	assert(getcwd(cwd_after, sizeof(cwd_after)) != nullptr);
	assert(strcmp(cwd_before, cwd_after) == 0);
	assert(pl.account() == "12345");
	assert(st.messages == 1 && st.attachments == 1 && st.blobs == 1);
	assert(file_exists(td / "real/zd/" + pic));

	auto db = open_db(dbpath);
	auto d = db.get();
	assert(q_text(d, "SELECT name FROM users WHERE id=7") == "Alice");
	assert(q_text(d, "SELECT name || '|' || size FROM attachments WHERE attachment_id=2") == "cat.png|7");
	assert(q_text(d, "SELECT blob FROM download_blobs WHERE normalized_url='" PIC_URL "'") == "PNGDATA");
	return EXIT_SUCCESS;
}

static int t_failures(const tmpdir &td)
{
	auto dbpath = td / "fresh.db";
	assert(make_dht(dbpath, false));
	zbk_import_param p;
	p.passphrase = "p";
	p.container  = td / "backup.zaloenc";
	p.database   = dbpath;
	p.decrypt.tmpdir = td / "scratch";
	zbk_pipeline pl(p);
	try {
		pl.run();
		printf("uninitialized store was accepted\n");
		return EXIT_FAILURE;
	} catch (const store_error &e) {
		printf("expected: %s\n", e.what());
	}
	assert(strcmp(pl.stage(), "store") == 0);

	p.database = td / "dht.db";
	p.passphrase = "not-p";
	zbk_pipeline pl2(p);
	try {
		pl2.run();
		printf("wrong passphrase was accepted\n");
		return EXIT_FAILURE;
	} catch (const format_error &e) {
		printf("expected: %s\n", e.what());
	}
	assert(strcmp(pl2.stage(), "decrypt") == 0);
	assert(dir_count(td / "scratch") == 0);
	return EXIT_SUCCESS;
}

int main()
{
	tmpdir td;
	assert(td.ok());
	using fpt = decltype(&t_end_to_end);
	fpt fct[] = {t_end_to_end, t_zalodownloads, t_failures};
	for (auto f : fct) {
		auto ret = f(td);
		if (ret != EXIT_SUCCESS)
			return ret;
	}
	return EXIT_SUCCESS;
}
