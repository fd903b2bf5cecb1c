/**
 * This file is part of libfastcdc.
 */

#ifndef FASTCDC_UTIL_POSIX_H_
#define FASTCDC_UTIL_POSIX_H_

#include <sys/types.h>

#include <cstdio>
#include <string>

#include "util/export.h"

namespace fastcdc {

FASTCDC_EXPORT ssize_t SafeRead(int fd, void *buf, size_t nbyte);
FASTCDC_EXPORT bool FileExists(const std::string &path);
FASTCDC_EXPORT FILE *CreateTempFile(const std::string &path_prefix,
                                    const int mode,
                                    const char *open_flags,
                                    std::string *final_path);

}  // namespace fastcdc

#endif  // FASTCDC_UTIL_POSIX_H_
