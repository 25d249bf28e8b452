// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2021–2026 grommunio GmbH
// This file is part of zalodht.
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iterator>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <strings.h>
#include <syslog.h>
#include <unistd.h>
#include <zalodht/util.hpp>

namespace zalodht {

namespace {
struct file_close {
	inline void operator()(FILE *f) const { fclose(f); }
};
}

static unsigned int g_max_loglevel = LV_NOTICE;
static bool g_log_tty, g_log_syslog;
static std::unique_ptr<FILE, file_close> g_logfp;
static std::mutex g_log_mutex;

bool parse_bool(const char *s)
{
	if (s == nullptr)
		return false;
	char *end = nullptr;
	if (strtoul(s, &end, 0) == 0 && *end == '\0')
		return false;
	if (strcasecmp(s, "no") == 0 || strcasecmp(s, "off") == 0 ||
	    strcasecmp(s, "false") == 0 || *s == '\0')
		return false;
	return true;
}

std::string bin2hex(const void *vin, size_t len)
{
	static constexpr char digits[] = "0123456789abcdef";
	std::string buf;
	if (vin == nullptr)
		return buf;
	auto input = static_cast<const uint8_t *>(vin);
	buf.resize(len * 2);
	for (size_t j = 0; len-- > 0; j += 2) {
		buf[j]   = digits[*input >> 4];
		buf[j+1] = digits[*input++ & 0x0F];
	}
	return buf;
}

/* Strict unsigned decimal that fits int64_t; no sign, no blanks. */
bool parse_decimal_id(const std::string_view &s, int64_t &out)
{
	if (s.empty() || s.size() > 19)
		return false;
	uint64_t v = 0;
	for (auto c : s) {
		if (c < '0' || c > '9')
			return false;
		v = v * 10 + (c - '0');
	}
	if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
		return false;
	out = v;
	return true;
}

std::vector<std::string> zd_split(const std::string_view &sv, char sep)
{
	size_t start = 0, pos;
	std::vector<std::string> out;
	while ((pos = sv.find(sep, start)) != sv.npos) {
		out.emplace_back(sv.substr(start, pos - start));
		start = pos + 1;
	}
	out.emplace_back(sv.substr(start));
	return out;
}

unsigned int mlog_level()
{
	return g_max_loglevel;
}

/**
 * @ident:	syslog identifier
 * @filename:	"-" or empty for stderr, "syslog", or a file to append to
 * @max_level:	messages above this level are suppressed
 */
void mlog_init(const char *ident, const char *filename, unsigned int max_level)
{
	g_max_loglevel = max_level;
	bool for_syslog = false, for_tty = false;
	if (filename == nullptr || *filename == '\0' || strcmp(filename, "-") == 0)
		for_tty = true;
	else if (strcmp(filename, "syslog") == 0)
		for_syslog = true;
	if (for_syslog) {
		openlog(ident, LOG_PID, LOG_USER);
		setlogmask((1 << (max_level + 2)) - 1);
		g_log_syslog = true;
		g_log_tty = false;
		g_logfp.reset();
		return;
	}
	if (for_tty) {
		g_log_tty = isatty(STDERR_FILENO);
		g_log_syslog = false;
		g_logfp.reset();
		setvbuf(stderr, nullptr, _IOLBF, 0);
		return;
	}
	g_log_tty = g_log_syslog = false;
	std::lock_guard hold(g_log_mutex);
	g_logfp.reset(fopen(filename, "a"));
	if (g_logfp == nullptr) {
		g_log_tty = isatty(STDERR_FILENO);
		mlog(LV_ERR, "Could not open %s for writing: %s. Using stderr.",
		        filename, strerror(errno));
		setvbuf(stderr, nullptr, _IOLBF, 0);
	} else {
		setvbuf(g_logfp.get(), nullptr, _IOLBF, 0);
	}
}

void mlog(unsigned int level, const char *fmt, ...)
{
	if (level > g_max_loglevel)
		return;
	va_list args;
	va_start(args, fmt);
	if (g_log_syslog) {
		vsyslog(level + 1, fmt, args);
		va_end(args);
		return;
	} else if (g_logfp == nullptr) {
		if (g_log_tty) {
			auto c = level <= LV_ERR ? "\e[1;31m" :
				 level <= LV_WARN ? "\e[31m" :
				 level <= LV_NOTICE ? "\e[1;37m" :
				 level == LV_DEBUG ? "\e[1;30m" : "";
			if (*c != '\0')
				fputs(c, stderr);
		}
		vfprintf(stderr, fmt, args);
		if (g_log_tty)
			fputs("\e[0m\n", stderr);
		else
			fputc('\n', stderr);
		va_end(args);
		return;
	}
	char buf[64];
	buf[0] = '<';
	buf[1] = '0' + level;
	buf[2] = '>';
	auto now = time(nullptr);
	struct tm tmbuf;
	strftime(buf + 3, std::size(buf) - 3, "%FT%T ", localtime_r(&now, &tmbuf));
	{
		std::lock_guard hold(g_log_mutex);
		fputs(buf, g_logfp.get());
		vfprintf(g_logfp.get(), fmt, args);
		fputc('\n', g_logfp.get());
	}
	va_end(args);
}

}
