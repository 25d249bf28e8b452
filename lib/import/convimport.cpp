// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of zalodht.
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <functional>
#include <memory>
#include <string>
#include <libHX/ctype_helper.h>
#include <libHX/io.h>
#include <libHX/string.h>
#include <json/value.h>
#include <zalodht/dhtstore.hpp>
#include <zalodht/errors.hpp>
#include <zalodht/import.hpp>
#include <zalodht/json.hpp>
#include <zalodht/nameres.hpp>
#include <zalodht/scope.hpp>
#include <zalodht/util.hpp>

namespace zalodht {

namespace {
struct file_close {
	inline void operator()(FILE *f) const { fclose(f); }
};
}

size_t zd_ndjson_foreach(dht_store &store, const char *path,
    const std::function<void(const Json::Value &)> &f)
{
	std::unique_ptr<FILE, file_close> fp(fopen(path, "r"));
	if (fp == nullptr)
		throw format_error("ZD-1501: %s: %s", path, strerror(errno));
	hxmc_t *line = nullptr;
	auto cl_0 = make_scope_exit([&]() { HXmc_free(line); });
	size_t lineno = 0, count = 0;
	while (HX_getl(&line, fp.get()) != nullptr) {
		++lineno;
		HX_chomp(line);
		auto p = line;
		while (HX_isspace(*p))
			++p;
		if (*p == '\0')
			continue;
		Json::Value jv;
		if (!str_to_json(p, jv) || !jv.isObject())
			throw format_error("ZD-1502: %s:%zu: not a JSON object", path, lineno);
		try {
			auto txn = store.begin();
			f(jv);
			auto ret = txn.commit();
			if (ret != SQLITE_OK)
				throw store_error("ZD-1503: COMMIT: %s", sqlite3_errstr(ret));
		} catch (const format_error &e) {
			throw format_error("%s:%zu: %s", path, lineno, e.what());
		} catch (const store_error &e) {
			throw store_error("%s:%zu: %s", path, lineno, e.what());
		}
		++count;
	}
	if (ferror(fp.get()))
		throw YError("ZD-1504: read %s: %s", path, strerror(errno));
	return count;
}

static void conv_entry(import_context &ctx, const Json::Value &jv)
{
	auto idstr = json_get_idstr(jv["userId"]);
	if (idstr.empty())
		throw format_error("ZD-1511: entry has no userId");
	auto cid  = conv_id::parse(idstr);
	auto name = display_name(ctx.names, cid);
	ctx.store.put_server(cid.id, name, cid.kind_str());
	ctx.store.put_channel(cid.id, cid.id, name);
	++ctx.stats.conversations;
}

void zd_import_conversations(import_context &ctx, const char *path)
{
	auto n = zd_ndjson_foreach(ctx.store, path,
	         [&](const Json::Value &jv) { conv_entry(ctx, jv); });
	mlog(LV_NOTICE, "zbk: %zu conversations from %s", n, path);
}

}
