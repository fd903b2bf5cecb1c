/**
 * This file is part of libfastcdc.
 *
 * Ensures that the library aborts on out-of-memory errors.
 */

#ifndef FASTCDC_UTIL_SMALLOC_H_
#define FASTCDC_UTIL_SMALLOC_H_

#include <stdint.h>
#include <stdlib.h>

#include <cassert>

namespace fastcdc {

static inline void * __attribute__((used)) smalloc(size_t size) {
  void *mem = NULL;
  mem = malloc(size);
  assert((mem || (size == 0)) && "Out Of Memory");
  return mem;
}

}  // namespace fastcdc

#endif  // FASTCDC_UTIL_SMALLOC_H_
