/**
 * This file is part of libfastcdc.
 */

#ifndef FASTCDC_INGESTION_READ_BUFFER_H_
#define FASTCDC_INGESTION_READ_BUFFER_H_

#include <stdint.h>
#include <sys/types.h>

#include "util/export.h"
#include "util/pointer.h"
#include "util/single_copy.h"

namespace fastcdc {

class IngestionSource;

/**
 * A fixed-size byte buffer that slides over an IngestionSource.  The window
 * [cursor, end) holds the bytes that were read but not yet consumed.  The
 * stream position is the absolute offset of the cursor in the source.
 *
 * The buffer is allocated once.  Reset() points it to another source without
 * reallocation.
 */
class FASTCDC_EXPORT ReadBuffer : SingleCopy {
 public:
  explicit ReadBuffer(const uint64_t capacity);

  /**
   * Makes sure that at least min_available bytes are in the window unless the
   * source runs dry first.  If the window is too small, the unconsumed bytes
   * are moved to the beginning of the buffer and the rest of the buffer is
   * read from the source.  The source is read until the buffer is full or
   * until it returns 0 (end of stream).  Once the end of stream was seen, the
   * source is not read anymore.
   *
   * @return false if the source reported an error.  The error is kept in
   *         last_error() and the bytes read before the failure stay in the
   *         window.
   */
  bool Fill(const uint64_t min_available);

  /**
   * Consumes nbytes from the front of the window.
   */
  void Advance(const uint64_t nbytes);

  /**
   * Discards the window and starts over at position 0 of the new source.
   */
  void Reset(IngestionSource *source);

  const unsigned char *data() const { return buffer_.weak_ref() + cursor_; }
  uint64_t size() const { return end_ - cursor_; }
  uint64_t capacity() const { return capacity_; }
  uint64_t stream_position() const { return stream_position_; }
  bool is_exhausted() const { return is_exhausted_; }
  ssize_t last_error() const { return last_error_; }

 private:
  const uint64_t capacity_;
  UniquePtr<unsigned char> buffer_;
  IngestionSource *source_;
  uint64_t cursor_;
  uint64_t end_;
  uint64_t stream_position_;
  bool is_exhausted_;
  ssize_t last_error_;
};

}  // namespace fastcdc

#endif  // FASTCDC_INGESTION_READ_BUFFER_H_
