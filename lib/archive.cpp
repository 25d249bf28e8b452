// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of zalodht.
#include <cerrno>
#include <cstring>
#include <map>
#include <memory>
#include <new>
#include <string>
#include <utility>
#include <vector>
#include <fcntl.h>
#include <unistd.h>
#include <archive.h>
#include <archive_entry.h>
#include <libHX/io.h>
#include <zalodht/archive.hpp>
#include <zalodht/errors.hpp>
#include <zalodht/scope.hpp>
#include <zalodht/util.hpp>

namespace zalodht {

namespace {
struct ar_read_free {
	inline void operator()(struct archive *a) const { archive_read_free(a); }
};
struct ar_write_free {
	inline void operator()(struct archive *a) const { archive_write_free(a); }
};
}

/**
 * Normalize @path into its components, dropping "." and empty ones.
 * Returns false for absolute paths and paths with a ".." component.
 */
static bool tar_path_split(const char *path, std::vector<std::string> &comp)
{
	comp.clear();
	if (path == nullptr || *path == '/')
		return false;
	for (auto &&c : zd_split(path, '/')) {
		if (c.empty() || c == ".")
			continue;
		if (c == "..")
			return false;
		comp.push_back(std::move(c));
	}
	return true;
}

bool tar_path_safe(const char *path)
{
	std::vector<std::string> comp;
	return tar_path_split(path, comp);
}

static void copy_data(struct archive *ar, struct archive *aw, const char *name)
{
	const void *buff;
	size_t size;
	la_int64_t offset;

	while (true) {
		auto r = archive_read_data_block(ar, &buff, &size, &offset);
		if (r == ARCHIVE_EOF)
			return;
		if (r < ARCHIVE_WARN)
			throw format_error("ZD-1201: %s: %s", name, archive_error_string(ar));
		if (archive_write_data_block(aw, buff, size, offset) < ARCHIVE_WARN)
			throw YError("ZD-1202: %s: %s", name, archive_error_string(aw));
	}
}

std::string zbk_extract(const char *tarfile, const std::string &outdir)
{
	auto ret = HX_mkdir(outdir.c_str(), 0777);
	if (ret < 0)
		throw YError("ZD-1203: mkdir %s: %s", outdir.c_str(), strerror(-ret));
	/*
	 * Entries are written relative to @outdir (like tar -C), so that the
	 * NODOTDOT/SYMLINKS checks only ever see names from the archive.
	 * The guard outlives @aw, whose cleanup still uses relative names.
	 */
	auto oldcwd = open(".", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
	if (oldcwd < 0)
		throw YError("ZD-1213: open .: %s", strerror(errno));
	auto cl_cwd = make_scope_exit([&]() {
		if (fchdir(oldcwd) != 0)
			mlog(LV_ERR, "E-1214: fchdir back: %s", strerror(errno));
		close(oldcwd);
	});
	std::unique_ptr<struct archive, ar_read_free> ar(archive_read_new());
	std::unique_ptr<struct archive, ar_write_free> aw(archive_write_disk_new());
	if (ar == nullptr || aw == nullptr)
		throw std::bad_alloc();
	archive_read_support_format_tar(ar.get());
	archive_write_disk_set_options(aw.get(), ARCHIVE_EXTRACT_TIME |
		ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS);
	archive_write_disk_set_standard_lookup(aw.get());
	if (archive_read_open_filename(ar.get(), tarfile, 10240) != ARCHIVE_OK)
		throw format_error("ZD-1204: %s: %s", tarfile, archive_error_string(ar.get()));
	if (chdir(outdir.c_str()) != 0)
		throw YError("ZD-1215: chdir %s: %s", outdir.c_str(), strerror(errno));

	/* top-level name -> whether it is a directory */
	std::map<std::string, bool> toplevel;
	std::vector<std::string> comp;
	size_t nfiles = 0;
	while (true) {
		struct archive_entry *entry = nullptr;
		auto r = archive_read_next_header(ar.get(), &entry);
		if (r == ARCHIVE_EOF)
			break;
		if (r < ARCHIVE_WARN)
			throw format_error("ZD-1205: %s: %s", tarfile, archive_error_string(ar.get()));
		auto name = archive_entry_pathname(entry);
		if (!tar_path_split(name, comp))
			throw format_error("ZD-1206: %s: entry \"%s\" escapes the output directory",
			      tarfile, znul(name));
		auto type = archive_entry_filetype(entry);
		if ((type != AE_IFREG && type != AE_IFDIR) ||
		    archive_entry_hardlink(entry) != nullptr)
			throw format_error("ZD-1207: %s: entry \"%s\" has unsupported type %o",
			      tarfile, name, static_cast<unsigned int>(type));
		if (comp.empty())
			/* "./" itself */
			continue;
		auto isdir = comp.size() > 1 || type == AE_IFDIR;
		auto [it, added] = toplevel.emplace(comp[0], isdir);
		if (!added && isdir)
			it->second = true;

		std::string full;
		for (const auto &c : comp) {
			if (!full.empty())
				full += '/';
			full += c;
		}
		archive_entry_set_pathname(entry, full.c_str());
		if (archive_write_header(aw.get(), entry) < ARCHIVE_WARN)
			throw YError("ZD-1208: %s: %s", full.c_str(), archive_error_string(aw.get()));
		if (type == AE_IFREG) {
			copy_data(ar.get(), aw.get(), full.c_str());
			++nfiles;
		}
		if (archive_write_finish_entry(aw.get()) < ARCHIVE_WARN)
			throw YError("ZD-1209: %s: %s", full.c_str(), archive_error_string(aw.get()));
	}
	if (archive_write_close(aw.get()) < ARCHIVE_WARN)
		throw YError("ZD-1210: %s: %s", outdir.c_str(), archive_error_string(aw.get()));
	if (toplevel.size() != 1)
		throw format_error("ZD-1211: %s: expected exactly one top-level entry, found %zu",
		      tarfile, toplevel.size());
	auto &[account, isdir] = *toplevel.begin();
	if (!isdir)
		throw format_error("ZD-1212: %s: top-level entry \"%s\" is not a directory",
		      tarfile, account.c_str());
	mlog(LV_INFO, "zbk: extracted %zu files for account %s into %s",
		nfiles, account.c_str(), outdir.c_str());
	return account;
}

}
