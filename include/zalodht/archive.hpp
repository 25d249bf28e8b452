#pragma once
#include <string>
#include <zalodht/defs.h>

namespace zalodht {

/*
 * Unpack the tar @tarfile below @outdir (created if missing) and return the
 * name of the archive's single top-level directory, which is the account id.
 */
extern ZD_EXPORT std::string zbk_extract(const char *tarfile, const std::string &outdir);
extern ZD_EXPORT bool tar_path_safe(const char *);

}
