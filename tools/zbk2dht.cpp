// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of zalodht.
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <libHX/option.h>
#include <zalodht/config_file.hpp>
#include <zalodht/database.h>
#include <zalodht/errors.hpp>
#include <zalodht/import.hpp>
#include <zalodht/util.hpp>

using namespace zalodht;

static char *g_config_file, *g_index_file;
static unsigned int g_verbose, g_sqlite_debug;
static constexpr HXoption g_options_table[] = {
	{nullptr, 'c', HXTYPE_STRING, &g_config_file, nullptr, nullptr, 0, "Config file to read", "FILE"},
	{"index", 'i', HXTYPE_STRING, &g_index_file, nullptr, nullptr, 0, "Zalo Index.db for user and group names", "FILE"},
	{nullptr, 'v', HXTYPE_NONE, &g_verbose, nullptr, nullptr, 0, "More detailed logging (repeatable)"},
	{"sqlite-debug", 0, HXTYPE_NONE, &g_sqlite_debug, nullptr, nullptr, 0, "Log every SQL statement"},
	HXOPT_AUTOHELP,
	HXOPT_TABLEEND,
};

static constexpr cfg_directive zbk2dht_cfg_defaults[] = {
	{"decrypt_chunk_size", "1M", CFG_SIZE, "16"},
	{"downloads_dir", ""},
	{"index_cipher_compat", ""},
	{"log_file", "-"},
	{"log_level", "4" /* LV_NOTICE */},
	{"sqlite_debug", "0"},
	{"tmpdir", ""},
	{"verify_tar_magic", "yes", CFG_BOOL},
	CFG_TABLE_END,
};

static void terse_help()
{
	fprintf(stderr, "Usage: zalodht-zbk2dht [-i Index.db] passphrase backup.zaloenc dht.db\n");
	fprintf(stderr, "A passphrase of \"-\" is taken from $ZBKPASS.\n");
	fprintf(stderr, "Option overview: zalodht-zbk2dht -?\n");
}

int main(int argc, const char **argv)
{
	setvbuf(stdout, nullptr, _IOLBF, 0);
	if (HX_getopt(g_options_table, &argc, &argv, HXOPT_USAGEONERR) != HXOPT_ERR_SUCCESS)
		return EXIT_FAILURE;
	if (argc != 4) {
		terse_help();
		return EXIT_FAILURE;
	}
	auto cfg = config_file_prg(g_config_file, "zbk2dht.cfg", zbk2dht_cfg_defaults);
	if (cfg == nullptr) {
		fprintf(stderr, "Something went wrong with config files\n");
		return EXIT_FAILURE;
	}
	auto level = std::min(cfg->get_ll("log_level") + g_verbose,
	             static_cast<unsigned long long>(LV_DEBUG));
	mlog_init("zbk2dht", cfg->get_value("log_file"), level);
	zd_sqlite_debug = std::max(static_cast<unsigned int>(cfg->get_ll("sqlite_debug")), g_sqlite_debug);
	if (zd_sqlite_debug > 0 && mlog_level() < LV_DEBUG)
		mlog(LV_NOTICE, "zbk2dht: sqlite_debug is on, but only shows at log_level 6 (-vv)");

	zbk_import_param p;
	p.passphrase = argv[1];
	if (p.passphrase == "-") {
		auto env = getenv("ZBKPASS");
		if (env == nullptr) {
			fprintf(stderr, "Passphrase \"-\" given, but ZBKPASS is not set\n");
			return EXIT_FAILURE;
		}
		p.passphrase = env;
	}
	p.container = argv[2];
	p.database  = argv[3];
	if (g_index_file != nullptr)
		p.index = g_index_file;
	p.index_cipher_compat = cfg->get_value("index_cipher_compat");
	p.downloads_dir = cfg->get_value("downloads_dir");
	p.decrypt.chunk_size   = cfg->get_ll("decrypt_chunk_size");
	p.decrypt.verify_magic = parse_bool(cfg->get_value("verify_tar_magic"));
	std::string tmpdir = cfg->get_value("tmpdir");
	if (tmpdir.empty()) {
		auto env = getenv("TMPDIR");
		tmpdir = env != nullptr && *env != '\0' ? env : "/tmp";
	}
	p.decrypt.tmpdir = std::move(tmpdir);

	zbk_pipeline pl(p);
	try {
		auto st = pl.run();
		mlog(LV_NOTICE, "zbk2dht: %s imported into %s: %zu conversations, "
			"%zu messages, %zu attachments (%zu cached), %zu replies",
			p.container.c_str(), p.database.c_str(), st.conversations,
			st.messages, st.attachments, st.blobs, st.replies);
	} catch (const format_error &e) {
		mlog(LV_ERR, "zbk2dht: %s: %s", pl.stage(), e.what());
		if (strcmp(pl.stage(), "extract") == 0)
			mlog(LV_ERR, "zbk2dht: an unreadable archive usually means a wrong passphrase");
		return EXIT_FAILURE;
	} catch (const std::exception &e) {
		mlog(LV_ERR, "zbk2dht: %s: %s", pl.stage(), e.what());
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
}
