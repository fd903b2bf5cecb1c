/**
 * This file is part of libfastcdc.
 */

#ifndef FASTCDC_INGESTION_CHUNK_H_
#define FASTCDC_INGESTION_CHUNK_H_

#include <stdint.h>

#include <cstddef>
#include <vector>

#include "util/export.h"

namespace fastcdc {

/**
 * One content-defined piece of a stream.  The data pointer points into the
 * chunker's read buffer and is valid only until the next call to Next() or
 * Reset() on the same chunker.
 *
 * The fingerprint is the rolling hash at the cut mark.  Chunks at the end of
 * the stream that are not longer than the minimal chunk size are not hashed
 * and carry the fingerprint 0.  It is not a content hash.
 */
struct FASTCDC_EXPORT Chunk {
  Chunk() : offset(0), length(0), data(NULL), fingerprint(0) { }

  std::vector<unsigned char> CopyData() const {
    if (length == 0)
      return std::vector<unsigned char>();
    return std::vector<unsigned char>(data, data + length);
  }

  uint64_t offset;
  uint64_t length;
  const unsigned char *data;
  uint64_t fingerprint;
};

}  // namespace fastcdc

#endif  // FASTCDC_INGESTION_CHUNK_H_
