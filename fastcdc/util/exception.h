/**
 * This file is part of libfastcdc.
 */

#ifndef FASTCDC_UTIL_EXCEPTION_H_
#define FASTCDC_UTIL_EXCEPTION_H_

#include <stdexcept>
#include <string>

#include "util/export.h"
#include "util/logging.h"

namespace fastcdc {

class FASTCDC_EXPORT EFastcdcException : public std::runtime_error {
 public:
  explicit EFastcdcException(const std::string& what_arg)
      : std::runtime_error(what_arg) {}
};

#define FASTCDC_S1(x) #x
#define FASTCDC_S2(x) FASTCDC_S1(x)
#define FASTCDC_SOURCE_LOCATION "PANIC: " __FILE__ " : " FASTCDC_S2(__LINE__)
#define PANIC(...) \
  fastcdc::Panic(FASTCDC_SOURCE_LOCATION, fastcdc::kLogChunker, __VA_ARGS__);

/**
 * Reports a broken invariant.  Logs the message together with the source
 * coordinates and aborts, or throws EFastcdcException if the library is built
 * with FASTCDC_RAISE_EXCEPTIONS.
 */
FASTCDC_EXPORT
__attribute__((noreturn))
void Panic(const char *coordinates, const LogSource source, const int mask,
           const char *format, ...);

// For PANIC(NULL)
FASTCDC_EXPORT
__attribute__((noreturn))
void Panic(const char *coordinates, const LogSource source, const char *nul);

}  // namespace fastcdc

#endif  // FASTCDC_UTIL_EXCEPTION_H_
