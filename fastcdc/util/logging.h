/**
 * This file is part of libfastcdc.
 */

#ifndef FASTCDC_UTIL_LOGGING_H_
#define FASTCDC_UTIL_LOGGING_H_

#include <string>

#include "util/export.h"
// Shared declarations of debug and non-debug logging
#include "util/logging_internal.h"

namespace fastcdc {

FASTCDC_EXPORT
void vLogFastcdc(const LogSource source, const int mask,
                 const char *format, va_list variadic_list);
__attribute__((format(printf, 3, 4)))
FASTCDC_EXPORT
void LogFastcdc(const LogSource source, const int mask,
                const char *format, ...);
// Ensure that pure debug messages are not compiled except in DEBUGMSG mode
#ifndef DEBUGMSG
#define LogFastcdc(source, mask, ...) \
  (((mask) == static_cast<int>(fastcdc::kLogDebug)) ? \
    ((void)0) : fastcdc::LogFastcdc(source, mask, __VA_ARGS__))  // NOLINT
#endif

}  // namespace fastcdc

#endif  // FASTCDC_UTIL_LOGGING_H_
