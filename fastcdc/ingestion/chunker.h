/**
 * This file is part of libfastcdc.
 */

#ifndef FASTCDC_INGESTION_CHUNKER_H_
#define FASTCDC_INGESTION_CHUNKER_H_

#include <stdint.h>
#include <sys/types.h>

#include "ingestion/chunk.h"
#include "ingestion/chunk_detector.h"
#include "ingestion/chunker_params.h"
#include "ingestion/read_buffer.h"
#include "util/export.h"
#include "util/single_copy.h"

namespace fastcdc {

class IngestionSource;

/**
 * Splits the byte stream of an IngestionSource into content-defined chunks
 * using FastCDC 2020.  Usage:
 *
 *   Failures failure;
 *   Chunker *chunker = Chunker::Create(
 *     &source, 16384, ChunkerOptions().WithSeed(666), &failure);
 *   if (chunker == NULL) ... Code2Ascii(failure) ...
 *   Chunk chunk;
 *   while (chunker->Next(&chunk) == Chunker::kNextOk) {
 *     ... chunk.offset, chunk.length, chunk.data, chunk.fingerprint ...
 *   }
 *
 * Chunks are returned in stream order without gaps.  Apart from the last
 * chunk of the stream, every chunk is at least min_size and at most max_size
 * bytes long.  The output depends only on the stream content and the
 * parameters, not on how the source partitions its reads.
 *
 * A Chunker is not thread-safe.  It does not take ownership of the source.
 */
class FASTCDC_EXPORT Chunker : SingleCopy {
 public:
  enum NextStatus {
    kNextOk = 0,
    kNextEndOfStream,
    kNextReadError,
  };

  /**
   * Returns NULL if the options are invalid.  The reason is stored in failure.
   */
  static Chunker *Create(IngestionSource *source,
                         const uint64_t average_size,
                         const ChunkerOptions &options,
                         Failures *failure);
  /**
   * Uses parameters that passed ChunkerParams::Resolve() before.  Returns
   * NULL for default constructed parameters.
   */
  static Chunker *Create(IngestionSource *source, const ChunkerParams &params);

  /**
   * Produces the next chunk.  After kNextEndOfStream, further calls keep
   * returning kNextEndOfStream.  After kNextReadError, the chunker has to be
   * Reset() before it can be used again.
   */
  NextStatus Next(Chunk *chunk);

  /**
   * Starts over with a new source, reusing buffer and tables.
   */
  void Reset(IngestionSource *source);

  /**
   * The negative value returned by the failed IngestionSource::Read(), 0 if
   * there was no read error since construction or the last Reset().
   */
  ssize_t read_error() const { return buffer_.last_error(); }
  const ChunkerParams &params() const { return params_; }
  uint64_t stream_position() const { return buffer_.stream_position(); }
  bool MightFindChunks(const uint64_t size) const {
    return detector_.MightFindChunks(size);
  }

 private:
  Chunker(IngestionSource *source, const ChunkerParams &params);

  const ChunkerParams params_;
  const GearDetector detector_;
  ReadBuffer buffer_;
};

}  // namespace fastcdc

#endif  // FASTCDC_INGESTION_CHUNKER_H_
