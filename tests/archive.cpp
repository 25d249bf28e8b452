// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 grommunio GmbH
// This file is part of zalodht.
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>
#include <zalodht/archive.hpp>
#include <zalodht/errors.hpp>
#include "testutil.hpp"
#undef assert
#define assert(x) do { if (!(x)) { printf("%s failed\n", #x); return EXIT_FAILURE; } } while (false)
using namespace zalodht;
using namespace zdtest;

/* Extraction of @ents must be refused. */
static bool refused(const tmpdir &td, const char *tag, const std::vector<tar_ent> &ents)
{
	auto tarfile = td / (std::string(tag) + ".tar");
	if (!tar_build(tarfile, ents)) {
		printf("%s: could not build the fixture\n", tag);
		return false;
	}
	try {
		zbk_extract(tarfile.c_str(), td / (std::string(tag) + ".out"));
	} catch (const format_error &e) {
		printf("%s: expected: %s\n", tag, e.what());
		return true;
	}
	printf("%s: extraction unexpectedly succeeded\n", tag);
	return false;
}

static int t_good(const tmpdir &td)
{
	auto tarfile = td / "good.tar";
	assert(tar_build(tarfile, {
		{"12345/", {}, AE_IFDIR},
		{"12345/Downloads/database/12345_zmessage.zdb", "{}\n"},
		{"./12345/Downloads/picture/7/z1_x.jpg", "JPEG"},
	}));
	auto out = td / "good";
	assert(zbk_extract(tarfile.c_str(), out) == "12345");
	assert(read_file(out + "/12345/Downloads/database/12345_zmessage.zdb") == "{}\n");
	assert(read_file(out + "/12345/Downloads/picture/7/z1_x.jpg") == "JPEG");
	/* again, into the now-existing directory */
	assert(zbk_extract(tarfile.c_str(), out) == "12345");
	assert(read_file(out + "/12345/Downloads/picture/7/z1_x.jpg") == "JPEG");
	assert(dir_count(out) == 1);

	/* implicit top-level directory */
	tarfile = td / "implicit.tar";
	assert(tar_build(tarfile, {{"777/a", "a"}}));
	assert(zbk_extract(tarfile.c_str(), td / "implicit") == "777");
	return EXIT_SUCCESS;
}

static int t_bad(const tmpdir &td)
{
	assert(refused(td, "traversal", {{"1/", {}, AE_IFDIR}, {"1/../../evil", "x"}}));
	assert(!file_exists(td / "evil"));
	assert(refused(td, "absolute", {{"/tmp/zdtest-evil", "x"}}));
	assert(refused(td, "symlink", {{"1/", {}, AE_IFDIR}, {"1/l", {}, AE_IFLNK, "/etc/passwd"}}));
	assert(refused(td, "twotop", {{"1/", {}, AE_IFDIR}, {"2/", {}, AE_IFDIR}}));
	assert(refused(td, "filetop", {{"justafile", "x"}}));
	assert(refused(td, "empty", {}));
	assert(tar_path_safe("a/b/./c"));
	assert(!tar_path_safe("a/../b"));
	assert(!tar_path_safe("/a"));
	return EXIT_SUCCESS;
}

int main()
{
	tmpdir td;
	assert(td.ok());
	auto ret = t_good(td);
	if (ret != EXIT_SUCCESS)
		return ret;
	return t_bad(td);
}
