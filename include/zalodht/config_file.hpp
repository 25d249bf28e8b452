#pragma once
#include <map>
#include <memory>
#include <string>
#include <zalodht/defs.h>
#define CFG_TABLE_END {}
#ifndef PKGSYSCONFDIR
#	define PKGSYSCONFDIR "/etc/zalodht"
#endif

enum cfg_flags {
	CFG_BOOL = 0x1U,
	CFG_SIZE = 0x2U,
};

/**
 * @deflt:	default value for this key
 * @min,@max:	clamp value to minimum/maximum (only if %CFG_SIZE)
 */
struct cfg_directive {
	const char *key = nullptr, *deflt = nullptr;
	unsigned int flags = 0;
	const char *min = nullptr, *max = nullptr;
};

class ZD_EXPORT config_file {
	public:
	config_file() = default;
	config_file(const cfg_directive *);
	const char *get_value(const char *key) const __attribute__((nonnull(2)));
	unsigned long long get_ll(const char *key) const __attribute__((nonnull(2)));
	void set_value(const char *k, const char *v) __attribute__((nonnull(2,3)));

	std::string m_filename;

	private:
	struct ZD_EXPORT cfg_entry {
		cfg_entry() = default;
		cfg_entry(const char *s) __attribute__((nonnull(2))) : m_val(s) {}
		cfg_entry(const cfg_directive &d);
		void set(const char *s) __attribute__((nonnull(2)));
		std::string m_val, m_min, m_max;
		unsigned int m_flags = 0;
	};
	std::map<std::string, cfg_entry> m_vars;
};

extern ZD_EXPORT std::shared_ptr<config_file> config_file_init(const char *filename, const cfg_directive *);
extern ZD_EXPORT std::shared_ptr<config_file> config_file_initd(const char *basename, const char *searchdirs, const cfg_directive *);
extern ZD_EXPORT std::shared_ptr<config_file> config_file_prg(const char *priority_location, const char *fallback_location_basename, const cfg_directive *);
