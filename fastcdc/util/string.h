/**
 * This file is part of libfastcdc.
 */

#ifndef FASTCDC_UTIL_STRING_H_
#define FASTCDC_UTIL_STRING_H_

#include <stdint.h>

#include <cstdio>
#include <string>
#include <vector>

#include "util/export.h"

namespace fastcdc {

FASTCDC_EXPORT bool String2Uint64Parse(const std::string &value,
                                       uint64_t *result);
FASTCDC_EXPORT std::vector<std::string> SplitString(const std::string &str,
                                                    char delim);
FASTCDC_EXPORT std::string JoinStrings(const std::vector<std::string> &strings,
                                       const std::string &joint);
FASTCDC_EXPORT bool GetLineFile(FILE *f, std::string *line);
FASTCDC_EXPORT std::string Trim(const std::string &raw,
                                bool trim_newline = false);

}  // namespace fastcdc

#endif  // FASTCDC_UTIL_STRING_H_
