/**
 * This file is part of libfastcdc.
 */

#include "ingestion/chunk_detector.h"

#include <inttypes.h>

#include <algorithm>

#include "util/exception.h"

namespace fastcdc {

GearDetector::GearDetector(const ChunkerParams &params)
  : minimal_chunk_size_(params.min_size())
  , normalize_size_(params.average_size())
  , maximal_chunk_size_(params.max_size())
  , gear_(params.seed())
{
  if (!CutMasks::Select(params.average_size(), params.normalization(),
                        &masks_))
  {
    PANIC(kLogStderr,
          "no cut masks for average size %" PRIu64 ", normalization %u",
          params.average_size(), params.normalization());
  }
}


uint64_t GearDetector::FindCutMark(
  const unsigned char *data,
  const uint64_t size,
  uint64_t *fingerprint) const
{
  if (size <= minimal_chunk_size_) {
    *fingerprint = 0;
    return size;
  }

  const uint64_t max_boundary = std::min(size, maximal_chunk_size_);
  const uint64_t normalize_boundary = std::min(max_boundary, normalize_size_);

  // The pairwise scan only ever stops at even offsets
  const uint64_t scan_start = minimal_chunk_size_ & ~uint64_t(1);
  const uint64_t normalize_at = normalize_boundary & ~uint64_t(1);
  const uint64_t scan_end = max_boundary & ~uint64_t(1);

  const uint64_t *gear = gear_.base();
  const uint64_t *gear_shifted = gear_.shifted();
  uint64_t fp = 0;
  uint64_t i = scan_start;

  for (; i < normalize_at; i += 2) {
    fp = (fp << 2) + gear_shifted[data[i]];
    if ((fp & masks_.small_shifted) == 0) {
      *fingerprint = fp;
      return i;
    }
    fp += gear[data[i + 1]];
    if ((fp & masks_.small) == 0) {
      *fingerprint = fp;
      return i + 1;
    }
  }

  for (; i < scan_end; i += 2) {
    fp = (fp << 2) + gear_shifted[data[i]];
    if ((fp & masks_.large_shifted) == 0) {
      *fingerprint = fp;
      return i;
    }
    fp += gear[data[i + 1]];
    if ((fp & masks_.large) == 0) {
      *fingerprint = fp;
      return i + 1;
    }
  }

  *fingerprint = fp;
  return max_boundary;
}

}  // namespace fastcdc
