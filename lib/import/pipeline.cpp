// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of zalodht.
#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <unistd.h>
#include <sys/stat.h>
#include <zalodht/archive.hpp>
#include <zalodht/container.hpp>
#include <zalodht/cryptoutil.hpp>
#include <zalodht/dhtstore.hpp>
#include <zalodht/errors.hpp>
#include <zalodht/import.hpp>
#include <zalodht/nameres.hpp>
#include <zalodht/scope.hpp>
#include <zalodht/util.hpp>

namespace zalodht {

static bool is_dir(const std::string &path)
{
	struct stat sb;
	return stat(path.c_str(), &sb) == 0 && S_ISDIR(sb.st_mode);
}

import_stats zbk_pipeline::run()
{
	auto &p = m_param;
	m_stage = "store";
	dht_store store;
	store.open(p.database.c_str());

	m_stage = "index";
	std::unique_ptr<name_resolver> names;
	if (!p.index.empty()) {
		auto ir = std::make_unique<index_resolver>();
		ir->open(p.index.c_str(), p.passphrase, p.index_cipher_compat.c_str());
		names = std::move(ir);
	} else {
		names = std::make_unique<null_resolver>();
	}

	m_stage = "decrypt";
	m_outdir = zbk_strip_suffixes(p.container);
	if (m_outdir == p.container)
		throw format_error("ZD-1601: %s: container name has no suffix to strip "
		      "for the output directory", p.container.c_str());
	auto ks = zbk_derive_key(p.passphrase, p.container);
	{
		auto scratch = zbk_decrypt(p.container.c_str(), ks, p.decrypt);
		auto cl_0 = make_scope_exit([&]() {
			if (unlink(scratch.c_str()) != 0 && errno != ENOENT)
				mlog(LV_WARN, "W-1602: unlink %s: %s", scratch.c_str(), strerror(errno));
		});
		m_stage = "extract";
		m_account = zbk_extract(scratch.c_str(), m_outdir);
	}

	std::string media = m_outdir + "/" + m_account + "/";
	if (!p.downloads_dir.empty())
		media += p.downloads_dir;
	else if (is_dir(media + "ZaloDownloads"))
		media += "ZaloDownloads";
	else
		media += "Downloads";
	mlog(LV_INFO, "zbk: account %s, media below %s", m_account.c_str(), media.c_str());

	import_context ctx{store, *names, m_account, media};
	auto dbdir = media + "/database/" + m_account;
	m_stage = "conversations";
	zd_import_conversations(ctx, (dbdir + "_zconversation.zdb").c_str());
	m_stage = "messages";
	zd_import_messages(ctx, (dbdir + "_zmessage.zdb").c_str());
	m_stage = "done";
	return ctx.stats;
}

}
