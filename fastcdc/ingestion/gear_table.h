/**
 * This file is part of libfastcdc.
 */

#ifndef FASTCDC_INGESTION_GEAR_TABLE_H_
#define FASTCDC_INGESTION_GEAR_TABLE_H_

#include <stdint.h>

#include "util/export.h"

namespace fastcdc {

static const unsigned kGearTableSize = 256;
// The mask table covers bit-widths 5 to 25; lower entries are padding
static const unsigned kMinMaskBits = 5;
static const unsigned kMaxMaskBits = 25;

/**
 * The FastCDC 2020 gear table, one pseudo-random 64-bit value per byte value.
 * Never modified; seeded tables are private copies.
 */
extern const uint64_t kGearTable[kGearTableSize];

/**
 * Normalized chunking masks of the FastCDC 2020 paper (Table II), indexed by
 * the number of bits, e.g. kCutMasks[13] is for 8kB chunks.
 */
extern const uint64_t kCutMasks[kMaxMaskBits + 1];


/**
 * Holds the gear table and its copy with every entry shifted left by one bit.
 * The shifted table lets the rolling hash consume two bytes per iteration.
 * A non-zero seed is XORed into both tables (shifted by one for the shifted
 * table), which puts the chunker into a different "namespace" of cut points.
 */
class FASTCDC_EXPORT GearTable {
 public:
  explicit GearTable(const uint64_t seed = 0);

  const uint64_t *base() const { return base_; }
  const uint64_t *shifted() const { return shifted_; }
  uint64_t seed() const { return seed_; }

 private:
  uint64_t seed_;
  uint64_t base_[kGearTableSize];
  uint64_t shifted_[kGearTableSize];
};


/**
 * The masks tested in the two phases of the cut point search.  The small mask
 * has more bits set than the average-sized mask and is used before the
 * normalization point, the large mask has fewer bits set and is used after.
 */
struct FASTCDC_EXPORT CutMasks {
  CutMasks() : small(0), large(0), small_shifted(0), large_shifted(0) { }

  /**
   * Picks the masks for log2(average_size) +/- normalization.  Returns false
   * if one of the two bit-widths is not covered by kCutMasks.
   */
  static bool Select(const uint64_t average_size,
                     const unsigned normalization,
                     CutMasks *masks);

  uint64_t small;
  uint64_t large;
  uint64_t small_shifted;
  uint64_t large_shifted;
};


/**
 * Position of the lowest set bit, i.e. log2 for powers of two.
 */
inline unsigned Log2Pow2(const uint64_t power_of_two) {
  return static_cast<unsigned>(__builtin_ctzll(power_of_two));
}

}  // namespace fastcdc

#endif  // FASTCDC_INGESTION_GEAR_TABLE_H_
