/**
 * This file is part of libfastcdc.
 */

#include "ingestion/chunker.h"

#include <inttypes.h>

#include "ingestion/ingestion_source.h"
#include "util/logging.h"

namespace fastcdc {

Chunker *Chunker::Create(
  IngestionSource *source,
  const uint64_t average_size,
  const ChunkerOptions &options,
  Failures *failure)
{
  ChunkerParams params;
  *failure = ChunkerParams::Resolve(average_size, options, &params);
  if (*failure != kFailOk) {
    LogFastcdc(kLogChunker, kLogDebug,
               "invalid chunker options (average size %" PRIu64 "): %s",
               average_size, Code2Ascii(*failure));
    return NULL;
  }
  return new Chunker(source, params);
}


Chunker *Chunker::Create(IngestionSource *source, const ChunkerParams &params)
{
  if (params.average_size() == 0) {
    LogFastcdc(kLogChunker, kLogDebug, "chunker parameters are not resolved");
    return NULL;
  }
  return new Chunker(source, params);
}


Chunker::Chunker(IngestionSource *source, const ChunkerParams &params)
  : params_(params)
  , detector_(params)
  , buffer_(params.buffer_size())
{
  buffer_.Reset(source);
  LogFastcdc(kLogChunker, kLogDebug,
             "created chunker: min %" PRIu64 ", avg %" PRIu64 ", "
             "max %" PRIu64 ", normalization %u, buffer %" PRIu64,
             params_.min_size(), params_.average_size(), params_.max_size(),
             params_.normalization(), params_.buffer_size());
}


Chunker::NextStatus Chunker::Next(Chunk *chunk) {
  if (!buffer_.Fill(params_.max_size()))
    return kNextReadError;
  if (buffer_.size() == 0)
    return kNextEndOfStream;

  uint64_t fingerprint;
  const uint64_t length =
    detector_.FindCutMark(buffer_.data(), buffer_.size(), &fingerprint);

  chunk->offset = buffer_.stream_position();
  chunk->length = length;
  chunk->data = buffer_.data();
  chunk->fingerprint = fingerprint;

  buffer_.Advance(length);
  return kNextOk;
}


void Chunker::Reset(IngestionSource *source) {
  buffer_.Reset(source);
}

}  // namespace fastcdc
