/**
 * This file is part of libfastcdc.
 */

#ifndef FASTCDC_INGESTION_CHUNK_DETECTOR_H_
#define FASTCDC_INGESTION_CHUNK_DETECTOR_H_

#include <gtest/gtest_prod.h>
#include <stdint.h>

#include "ingestion/chunker_params.h"
#include "ingestion/gear_table.h"
#include "util/export.h"
#include "util/single_copy.h"

namespace fastcdc {

/**
 * The FastCDC 2020 cut mark detector [1].
 *
 * A gear-based rolling hash runs over the region following the minimal chunk
 * size.  Every byte shifts the fingerprint left and adds the byte's gear table
 * entry, so the fingerprint depends only on the last 64 bytes.  A cut mark is
 * found where the fingerprint has all bits of the current mask cleared.
 *
 * Normalized chunking uses two masks.  Up to the normalization point (the
 * average chunk size) the small mask has more bits set, which makes early cuts
 * less likely.  After it, the large mask has fewer bits set and late cuts
 * become more likely.  This narrows the chunk size distribution around the
 * average.
 *
 * The loop consumes two bytes per iteration.  The first byte of a pair is
 * hashed as (fp << 2) + shifted[b], tested against the left-shifted mask, the
 * second one with fp + gear[b] against the unshifted mask.  This yields the
 * same cut marks as a byte-wise fp = (fp << 1) + gear[b] scan with half the
 * shifts.
 *
 * The detector is stateless between calls.  It always inspects a region that
 * starts at a chunk boundary.
 *
 * [1]     "The Design of Fast Content-Defined Chunking for Data Deduplication
 *          Based Storage Systems"
 *     Wen Xia et al., IEEE TPDS (2020)
 */
class FASTCDC_EXPORT GearDetector : SingleCopy {
  FRIEND_TEST(T_ChunkDetector, Masks);
  FRIEND_TEST(T_ChunkDetector, SeededTables);

 public:
  explicit GearDetector(const ChunkerParams &params);

  /**
   * Returns the length of the chunk that starts at data.  The region is
   * either the rest of the stream or at least maximal_chunk_size bytes long.
   * The fingerprint is the rolling hash at the cut mark.  It is 0 if the
   * region is not longer than the minimal chunk size, in which case no hash
   * is computed and the whole region is one chunk.
   *
   * The scan starts at the minimal chunk size rounded down to an even offset.
   * With an odd minimal chunk size, the shortest chunk is therefore one byte
   * shorter than the minimal chunk size.
   */
  uint64_t FindCutMark(const unsigned char *data,
                       const uint64_t size,
                       uint64_t *fingerprint) const;

  bool MightFindChunks(const uint64_t size) const {
    return size > minimal_chunk_size_;
  }

  uint64_t minimal_chunk_size() const { return minimal_chunk_size_; }
  uint64_t normalize_size() const { return normalize_size_; }
  uint64_t maximal_chunk_size() const { return maximal_chunk_size_; }

 private:
  const uint64_t minimal_chunk_size_;
  const uint64_t normalize_size_;
  const uint64_t maximal_chunk_size_;

  const GearTable gear_;
  CutMasks masks_;
};

}  // namespace fastcdc

#endif  // FASTCDC_INGESTION_CHUNK_DETECTOR_H_
