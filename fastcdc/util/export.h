/**
 * This file is part of libfastcdc.
 */

#ifndef FASTCDC_UTIL_EXPORT_H_
#define FASTCDC_UTIL_EXPORT_H_

#ifdef FASTCDC_SHARED_LIBRARY
#define FASTCDC_EXPORT __attribute__((visibility("default")))
#else
#define FASTCDC_EXPORT
#endif

#endif  // FASTCDC_UTIL_EXPORT_H_
