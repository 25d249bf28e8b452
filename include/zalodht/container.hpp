#pragma once
#include <cstddef>
#include <string>
#include <zalodht/cryptoutil.hpp>
#include <zalodht/defs.h>

namespace zalodht {

struct zbk_decrypt_param {
	/* directory in which the plaintext scratch file is created */
	std::string tmpdir = "/tmp";
	size_t chunk_size = 1048576;
	bool verify_magic = true;
};

extern ZD_EXPORT std::string zbk_decrypt(const char *container, const zbk_keysched &, const zbk_decrypt_param &);
extern ZD_EXPORT bool tar_magic_ok(const void *block, size_t size);

}
