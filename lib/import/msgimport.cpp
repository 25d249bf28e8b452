// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of zalodht.
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/core.h>
#include <json/value.h>
#include <libHX/io.h>
#include <libHX/string.h>
#include <zalodht/cryptoutil.hpp>
#include <zalodht/dhtstore.hpp>
#include <zalodht/errors.hpp>
#include <zalodht/import.hpp>
#include <zalodht/json.hpp>
#include <zalodht/nameres.hpp>
#include <zalodht/util.hpp>

namespace zalodht {

namespace {

/* The fields every modeled message type needs. */
struct msg_entry {
	const Json::Value &jv;
	int64_t tag = 0, id = 0, sender = 0, ts = 0;
	conv_id chan;
};

using msg_handler = void (*)(import_context &, const msg_entry &);

struct msg_kind {
	int64_t tag;
	const char *name;
	msg_handler handler; /* nullptr: known, deliberately not imported */
};

}

static constexpr char recalled_text[] = "[Tin nhắn đã bị thu hồi]";

static int64_t need_int(const Json::Value &jv, const char *key)
{
	int64_t v = 0;
	if (!json_get_int64(jv[key], v))
		throw format_error("ZD-1521: field \"%s\" is missing or not a number", key);
	return v;
}

/* msgType also occurs negative, and sometimes as a string */
static bool get_tag(const Json::Value &jv, int64_t &tag)
{
	if (!jv.isString())
		return json_get_int64(jv, tag);
	std::string_view s = jv.asCString();
	auto neg = !s.empty() && s[0] == '-';
	if (neg)
		s.remove_prefix(1);
	if (!parse_decimal_id(s, tag))
		return false;
	if (neg)
		tag = -tag;
	return true;
}

static void put_sender(import_context &ctx, const msg_entry &m)
{
	auto &dn = m.jv["dName"];
	std::string given = dn.isString() ? dn.asString() : std::string();
	conv_id uid{conv_kind::dm, m.sender};
	ctx.store.put_user(m.sender, display_name(ctx.names, uid, given));
}

static void mh_text(import_context &ctx, const msg_entry &m)
{
	auto &pl = m.jv["message"];
	std::string text;
	if (pl.isString()) {
		text = pl.asString();
	} else if (pl.isObject() && pl["action"].isString() &&
	    pl["action"].asString() == "rtf" && pl["title"].isString()) {
		text = pl["title"].asString();
	} else if (m.tag == 20) {
		text = recalled_text;
	} else {
		throw format_error("ZD-1522: do not know how to handle msgType=%lld message=%s",
		      static_cast<long long>(m.tag), json_to_str(pl).c_str());
	}
	put_sender(ctx, m);
	ctx.store.put_message(m.id, m.sender, m.chan.id, text, m.ts);
	++ctx.stats.messages;
}

static std::optional<int64_t> param_dim(const Json::Value &params, const char *key)
{
	int64_t v = 0;
	if (params.isObject() && json_get_int64(params[key], v))
		return v;
	return std::nullopt;
}

static void mh_image(import_context &ctx, const msg_entry &m)
{
	auto &pl = m.jv["message"];
	put_sender(ctx, m);
	/* message row first, the attachment rows hang off it */
	ctx.store.put_message(m.id, m.sender, m.chan.id, {}, m.ts);
	++ctx.stats.messages;
	if (!pl.isObject())
		throw format_error("ZD-1523: image payload is not an object");

	Json::Value params;
	if (pl["params"].isObject())
		params = pl["params"];
	else if (pl["params"].isString() && !str_to_json(pl["params"].asString(), params))
		mlog(LV_DEBUG, "zbk: message %lld: unparsable image params",
		        static_cast<long long>(m.id));

	std::string url;
	for (const auto &[src, key] : {std::make_pair(&pl, "href"),
	     std::make_pair(&pl, "oriUrl"), std::make_pair(&pl, "hdUrl"),
	     std::make_pair(static_cast<const Json::Value *>(&params), "hd")}) {
		if (!src->isObject())
			continue;
		auto &v = (*src)[key];
		if (v.isString() && *v.asCString() != '\0') {
			url = v.asString();
			break;
		}
	}
	if (url.empty())
		throw format_error("ZD-1524: image without any URL");

	dht_attachment att;
	att.id  = m.id;
	att.url = url;
	std::string_view path = url;
	path = path.substr(0, path.find_first_of("?#"));
	auto slash = path.rfind('/');
	if (slash != path.npos)
		path.remove_prefix(slash + 1);
	att.name = path.empty() ? fmt::format("z{}", m.id) : std::string(path);
	std::string ext;
	auto dot = path.rfind('.');
	if (dot != path.npos && dot > 0 && dot + 1 < path.size())
		ext = path.substr(dot + 1);
	if (ext.empty()) {
		att.type = "application/octet-stream";
	} else {
		std::string lext = ext;
		HX_strlower(lext.data());
		att.type = "image/" + (lext == "jpg" ? std::string("jpeg") : lext);
	}
	att.width  = param_dim(params, "width");
	att.height = param_dim(params, "height");

	auto file = fmt::format("{}/picture/{}{}/z{}_{}{}{}", ctx.media_root,
	            m.chan.id, m.chan.is_group() ? "_group" : "", m.id,
	            md5_hex(url), ext.empty() ? "" : ".", ext);
	size_t size = 0;
	std::unique_ptr<char[], stdlib_delete> blob(static_cast<char *>(HX_slurp_file(file.c_str(), &size)));
	if (blob == nullptr) {
		if (errno != ENOENT)
			mlog(LV_WARN, "W-1525: %s: %s", file.c_str(), strerror(errno));
		else
			mlog(LV_DEBUG, "zbk: no local copy %s", file.c_str());
		size = 0;
	}
	att.size = size;
	ctx.store.put_attachment(att);
	ctx.store.put_msg_attachment(m.id, att.id);
	++ctx.stats.attachments;
	if (blob != nullptr) {
		ctx.store.put_download(url, att.type.c_str(), blob.get(), size);
		++ctx.stats.blobs;
	}
}

static constexpr msg_kind msg_kinds[] = {
	{1, "text", mh_text},
	{2, "image", mh_image},
	{3, "voice", nullptr},
	{4, "sticker", nullptr},
	{6, "link", nullptr},
	{7, "gif", nullptr},
	{17, "location", nullptr},
	{18, "video", nullptr},
	{19, "file", nullptr},
	{20, "recallable text", mh_text},
	{21, "embed", nullptr},
	{25, "friend request accepted", nullptr},
	{26, "poll", nullptr},
	{52, "zinstant", nullptr},
	{-1909, "pin", nullptr},
	{-27, "delete", nullptr},
	{-4, "group join/leave", nullptr},
};

static void quote_entry(import_context &ctx, const msg_entry &m, const Json::Value &q)
{
	auto owner = json_get_idstr(q["ownerId"]);
	if (owner.empty())
		throw format_error("ZD-1526: quote without ownerId");
	conv_id oid;
	/* "0" is the backup owner */
	if (owner == "0")
		owner = ctx.account;
	if (!parse_decimal_id(owner, oid.id))
		throw format_error("ZD-1527: quote owner \"%s\" is not a user id", owner.c_str());
	int64_t replied_to = 0;
	if (!json_get_int64(q["cliMsgId"], replied_to))
		throw format_error("ZD-1528: quote without cliMsgId");
	auto &fd = q["fromD"];
	ctx.store.put_user(oid.id, display_name(ctx.names, oid,
		fd.isString() ? fd.asString() : std::string()));
	ctx.store.put_reply(m.id, replied_to);
	++ctx.stats.replies;
}

static void msg_line(import_context &ctx, const Json::Value &jv)
{
	msg_entry m{jv};
	if (!get_tag(jv["msgType"], m.tag))
		throw format_error("ZD-1529: entry without a usable msgType");
	auto kind = std::find_if(std::begin(msg_kinds), std::end(msg_kinds),
	            [&](const msg_kind &k) { return k.tag == m.tag; });
	if (kind == std::end(msg_kinds)) {
		mlog(LV_DEBUG, "zbk: msgType %lld unknown, skipped",
		        static_cast<long long>(m.tag));
		++ctx.stats.ignored;
		return;
	}
	if (kind->handler == nullptr) {
		++ctx.stats.ignored;
		return;
	}
	try {
		m.id     = need_int(jv, "cliMsgId");
		m.sender = need_int(jv, "fromUid");
		m.ts     = need_int(jv, "serverTime");
		auto to  = json_get_idstr(jv["toUid"]);
		if (to.empty())
			throw format_error("ZD-1530: field \"toUid\" is missing");
		m.chan = conv_id::parse(to);
		auto &q = jv["quote"];
		if (q.isObject())
			quote_entry(ctx, m, q);
		kind->handler(ctx, m);
	} catch (const format_error &e) {
		throw format_error("%s %s: %s", kind->name,
		      json_to_str(jv["cliMsgId"]).c_str(), e.what());
	}
}

void zd_import_messages(import_context &ctx, const char *path)
{
	auto n = zd_ndjson_foreach(ctx.store, path,
	         [&](const Json::Value &jv) { msg_line(ctx, jv); });
	mlog(LV_NOTICE, "zbk: %zu message log entries from %s (%zu messages, "
		"%zu attachments, %zu cached, %zu replies, %zu not imported)",
		n, path, ctx.stats.messages, ctx.stats.attachments,
		ctx.stats.blobs, ctx.stats.replies, ctx.stats.ignored);
}

}
