/**
 * This file is part of libfastcdc.
 */

// Internal use, include only logging.h!

#ifndef FASTCDC_UTIL_LOGGING_INTERNAL_H_
#define FASTCDC_UTIL_LOGGING_INTERNAL_H_

#include <cstdarg>
#include <string>

#include "util/export.h"

namespace fastcdc {

enum LogFacilities {
  kLogDebug = 0x01,
  kLogStdout = 0x02,
  kLogStderr = 0x04,
  kLogSyslog = 0x08,
  kLogSyslogWarn = 0x10,
  kLogSyslogErr = 0x20,
};

enum LogFlags {
  kLogNoLinebreak = 0x200,
  kLogShowSource  = 0x400,
};

enum LogLevels {
  kLogLevel0   = 0x01000,
  kLogNormal   = 0x02000,
  kLogInform   = 0x04000,
  kLogVerbose  = 0x08000,
  kLogNone     = 0x10000,
};

/**
 * Changes in this enum must be done in logging.cc as well!
 * (see const char *module_names[] = {....})
 */
enum LogSource {
  kLogChunker = 1,
  kLogIngestion,
  kLogOptions,
  kLogUtility,
};

const int kLogWarning = kLogStdout | kLogShowSource | kLogNormal;
const int kLogInfoMsg = kLogStdout | kLogShowSource | kLogInform;
const int kLogVerboseMsg = kLogStdout | kLogShowSource | kLogVerbose;

FASTCDC_EXPORT void SetLogSyslogLevel(const int level);
FASTCDC_EXPORT int GetLogSyslogLevel();
FASTCDC_EXPORT void SetLogSyslogFacility(const int facility);
FASTCDC_EXPORT int GetLogSyslogFacility();
FASTCDC_EXPORT void SetLogSyslogPrefix(const std::string &prefix);
FASTCDC_EXPORT void SetLogVerbosity(const LogLevels max_level);

FASTCDC_EXPORT
void SetAltLogFunc(void (*fn)(const LogSource source, const int mask,
                              const char *msg));

}  // namespace fastcdc

#endif  // FASTCDC_UTIL_LOGGING_INTERNAL_H_
