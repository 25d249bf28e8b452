#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <openssl/evp.h>
#include <zalodht/defs.h>

namespace zalodht {

struct ZD_EXPORT sslfree {
	inline void operator()(EVP_CIPHER_CTX *x) const { EVP_CIPHER_CTX_free(x); }
};

/**
 * @key:	SHA-256 of the passphrase
 * @iv:		all-zero for single-suffix containers (e.g. "x.zaloenc"),
 * 		"zie" + passphrase[0..13) otherwise
 */
struct zbk_keysched {
	uint8_t key[32]{};
	uint8_t iv[16]{};
};

extern ZD_EXPORT size_t zbk_suffix_count(const std::string_view &filename);
extern ZD_EXPORT std::string zbk_strip_suffixes(const std::string_view &path);
extern ZD_EXPORT zbk_keysched zbk_derive_key(const std::string_view &passphrase, const std::string_view &filename);
extern ZD_EXPORT std::string md5_hex(const std::string_view &);

}
