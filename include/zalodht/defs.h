#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <type_traits>
#define ZD_EXPORT __attribute__((visibility("default")))
#define NOMOVE(K) \
	K(K &&) noexcept = delete; \
	void operator=(K &&) noexcept = delete;

enum zd_loglevel {
	LV_CRIT = 1,
	LV_ERR = 2,
	LV_WARN = 3,
	LV_NOTICE = 4,
	LV_INFO = 5,
	LV_DEBUG = 6,
};

namespace zalodht {

struct stdlib_delete {
	inline void operator()(void *x) const { free(x); }
};

static inline const char *znul(const char *s) { return s != nullptr ? s : ""; }

}
