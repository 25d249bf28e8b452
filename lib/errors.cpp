// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2021–2026 grommunio GmbH
// This file is part of zalodht.
#define _GNU_SOURCE 1
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <zalodht/errors.hpp>

namespace zalodht {

static std::string vfmt(const char *fmt, va_list args)
{
	if (strchr(fmt, '%') == nullptr)
		return fmt;
	char *raw = nullptr;
	auto ret = vasprintf(&raw, fmt, args);
	std::unique_ptr<char[], stdlib_delete> strp(raw);
	return ret >= 0 && strp != nullptr ? strp.get() : "vasprintf";
}

YError::YError(const std::string &s) : m_str(s)
{}

YError::YError(std::string &&s) : m_str(std::move(s))
{}

YError::YError(const char *fmt, ...)
{
	va_list args;
	va_start(args, fmt);
	m_str = vfmt(fmt, args);
	va_end(args);
}

format_error::format_error(const char *fmt, ...)
{
	va_list args;
	va_start(args, fmt);
	m_str = vfmt(fmt, args);
	va_end(args);
}

store_error::store_error(const char *fmt, ...)
{
	va_list args;
	va_start(args, fmt);
	m_str = vfmt(fmt, args);
	va_end(args);
}

}
