// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of zalodht.
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <string>
#include <unistd.h>
#include <sys/stat.h>
#include <libHX/io.h>
#include <openssl/evp.h>
#include <zalodht/container.hpp>
#include <zalodht/errors.hpp>
#include <zalodht/scope.hpp>
#include <zalodht/util.hpp>

namespace zalodht {

static constexpr size_t AES_BLOCK = 16, TAR_BLOCK = 512;

bool tar_magic_ok(const void *vblk, size_t size)
{
	/* POSIX "ustar\0" and GNU "ustar  " both start with these five */
	auto blk = static_cast<const char *>(vblk);
	return size >= TAR_BLOCK && memcmp(&blk[257], "ustar", 5) == 0;
}

namespace {
struct fd_close {
	int fd = -1;
	~fd_close() {
		if (fd >= 0)
			close(fd);
	}
};
}

/**
 * Decrypt @container into a fresh file below @p.tmpdir and return that file's
 * name. The ciphertext is streamed in @p.chunk_size pieces. If anything goes
 * wrong, the partial plaintext is unlinked before the exception leaves.
 */
std::string zbk_decrypt(const char *container, const zbk_keysched &ks,
    const zbk_decrypt_param &p)
{
	fd_close in;
	in.fd = open(container, O_RDONLY);
	if (in.fd < 0)
		throw YError("ZD-1101: open %s: %s", container, strerror(errno));
	struct stat sb;
	if (fstat(in.fd, &sb) != 0)
		throw YError("ZD-1102: stat %s: %s", container, strerror(errno));
	if (S_ISREG(sb.st_mode) && sb.st_size % AES_BLOCK != 0)
		throw format_error("ZD-1103: %s: size %lld is not a multiple of the cipher block size",
		      container, static_cast<long long>(sb.st_size));

	std::string scratch = p.tmpdir + "/zbk-XXXXXX";
	fd_close out;
	out.fd = mkstemp(scratch.data());
	if (out.fd < 0)
		throw YError("ZD-1104: mkstemp %s: %s", scratch.c_str(), strerror(errno));
	auto cl_0 = make_scope_exit([&]() {
		if (unlink(scratch.c_str()) != 0 && errno != ENOENT)
			mlog(LV_WARN, "W-1105: unlink %s: %s", scratch.c_str(), strerror(errno));
	});

	std::unique_ptr<EVP_CIPHER_CTX, sslfree> ctx(EVP_CIPHER_CTX_new());
	if (ctx == nullptr ||
	    EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, ks.key, ks.iv) <= 0 ||
	    EVP_CIPHER_CTX_set_padding(ctx.get(), 0) <= 0)
		throw YError("ZD-1106: AES-256-CBC unavailable");

	auto chunk = std::max(p.chunk_size / AES_BLOCK * AES_BLOCK, AES_BLOCK);
	auto ibuf = std::make_unique<uint8_t[]>(chunk);
	auto obuf = std::make_unique<uint8_t[]>(chunk + AES_BLOCK);
	uint64_t total = 0;
	while (true) {
		auto rd = HXio_fullread(in.fd, ibuf.get(), chunk);
		if (rd < 0)
			throw YError("ZD-1107: read %s: %s", container, strerror(errno));
		if (rd == 0)
			break;
		total += rd;
		int outlen = 0;
		if (EVP_DecryptUpdate(ctx.get(), obuf.get(), &outlen, ibuf.get(), rd) <= 0)
			throw YError("ZD-1108: EVP_DecryptUpdate failed");
		if (outlen > 0 && HXio_fullwrite(out.fd, obuf.get(), outlen) < 0)
			throw YError("ZD-1109: write %s: %s", scratch.c_str(), strerror(errno));
		if (static_cast<size_t>(rd) < chunk)
			break;
	}
	/* stdin, fifos and the like only reveal their length now */
	if (total % AES_BLOCK != 0)
		throw format_error("ZD-1110: %s: %llu bytes is not a multiple of the cipher block size",
		      container, static_cast<unsigned long long>(total));
	int outlen = 0;
	if (EVP_DecryptFinal_ex(ctx.get(), obuf.get(), &outlen) <= 0)
		throw format_error("ZD-1111: %s: trailing partial cipher block", container);
	if (p.verify_magic) {
		uint8_t hdr[TAR_BLOCK];
		auto ret = pread(out.fd, hdr, sizeof(hdr), 0);
		if (ret < 0)
			throw YError("ZD-1112: read %s: %s", scratch.c_str(), strerror(errno));
		if (!tar_magic_ok(hdr, ret))
			throw format_error("ZD-1113: %s: decrypted data is not a tar archive. "
			      "Wrong passphrase?", container);
	}
	if (close(out.fd) != 0) {
		out.fd = -1;
		throw YError("ZD-1114: close %s: %s", scratch.c_str(), strerror(errno));
	}
	out.fd = -1;
	cl_0.release();
	mlog(LV_INFO, "zbk: decrypted %llu bytes from %s into %s",
		static_cast<unsigned long long>(total), container, scratch.c_str());
	return scratch;
}

}
