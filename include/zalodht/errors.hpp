#pragma once
#include <exception>
#include <string>
#include <zalodht/defs.h>

namespace zalodht {

/*
 * Messages carry a "ZD-nnnn:" prefix so that a failing run can be matched to
 * the raise site without a debugger.
 */
class ZD_EXPORT YError : public std::exception {
	public:
	YError(const std::string &);
	YError(std::string &&);
	YError(const char *fmt, ...) __attribute__((format(printf, 2, 3)));
	virtual const char *what() const noexcept { return m_str.c_str(); }

	protected:
	YError() = default;
	std::string m_str;
};

/* Malformed container, archive, log line, or payload shape. Fatal. */
class ZD_EXPORT format_error final : public YError {
	public:
	using YError::YError;
	format_error(const char *fmt, ...) __attribute__((format(printf, 2, 3)));
};

/* Uninitialized target store, or an SQLite call that failed. Fatal. */
class ZD_EXPORT store_error final : public YError {
	public:
	using YError::YError;
	store_error(const char *fmt, ...) __attribute__((format(printf, 2, 3)));
};

}
