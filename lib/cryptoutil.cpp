// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2021-2026 grommunio GmbH
// This file is part of zalodht.
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <openssl/evp.h>
#include <zalodht/cryptoutil.hpp>
#include <zalodht/errors.hpp>
#include <zalodht/util.hpp>

namespace zalodht {

static std::string_view base_name(const std::string_view &path)
{
	auto pos = path.rfind('/');
	return pos == path.npos ? path : path.substr(pos + 1);
}

/*
 * Suffixes of a basename: nothing if it ends in '.', leading dots do not
 * count, every other dot starts one. "backup.zaloenc" has one,
 * "backup.tar.zaloenc" has two, ".hidden" has none.
 */
size_t zbk_suffix_count(const std::string_view &path)
{
	auto name = base_name(path);
	if (name.empty() || name.back() == '.')
		return 0;
	auto lead = name.find_first_not_of('.');
	if (lead == name.npos)
		return 0;
	name.remove_prefix(lead);
	return std::count(name.begin(), name.end(), '.');
}

std::string zbk_strip_suffixes(const std::string_view &path)
{
	auto name = base_name(path);
	auto dir  = path.substr(0, path.size() - name.size());
	while (zbk_suffix_count(name) > 0) {
		auto pos = name.rfind('.');
		if (pos == 0 || pos == name.npos || pos + 1 >= name.size())
			break;
		name = name.substr(0, pos);
	}
	std::string out(dir);
	out += name;
	return out;
}

zbk_keysched zbk_derive_key(const std::string_view &pass, const std::string_view &filename)
{
	zbk_keysched ks;
	unsigned int dlen = sizeof(ks.key);
	if (EVP_Digest(pass.data(), pass.size(), ks.key, &dlen, EVP_sha256(), nullptr) <= 0 ||
	    dlen != sizeof(ks.key))
		throw YError("ZD-1001: SHA-256 unavailable");
	if (zbk_suffix_count(filename) == 1)
		/* zero IV, ks.iv is value-initialized */
		return ks;
	static constexpr char ivprefix[] = "zie";
	memcpy(ks.iv, ivprefix, 3);
	memcpy(&ks.iv[3], pass.data(), std::min(pass.size(), sizeof(ks.iv) - 3));
	return ks;
}

std::string md5_hex(const std::string_view &s)
{
	uint8_t digest[EVP_MAX_MD_SIZE];
	unsigned int dlen = 0;
	if (EVP_Digest(s.data(), s.size(), digest, &dlen, EVP_md5(), nullptr) <= 0)
		throw YError("ZD-1002: MD5 unavailable");
	return bin2hex(digest, dlen);
}

}
