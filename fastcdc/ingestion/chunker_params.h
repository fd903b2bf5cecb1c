/**
 * This file is part of libfastcdc.
 */

#ifndef FASTCDC_INGESTION_CHUNKER_PARAMS_H_
#define FASTCDC_INGESTION_CHUNKER_PARAMS_H_

#include <stdint.h>

#include <string>

#include "util/export.h"

namespace fastcdc {

/**
 * Possible outcomes of resolving chunker options.  One code per violated
 * constraint; the checks run in the order of this enum.
 */
enum Failures {
  kFailOk = 0,
  kFailAverageSizeRange,
  kFailAverageSizeNotPow2,
  kFailMinSizeRange,
  kFailMaxSizeRange,
  kFailMinNotBelowMax,
  kFailAverageSizeBounds,
  kFailNormalizationLevel,
  kFailBufferSize,
  kFailMaskBitWidth,

  kFailNumEntries
};  // Failures


inline const char *Code2Ascii(const Failures error) {
  const char *texts[kFailNumEntries + 1];
  texts[0] = "OK";
  texts[1] = "average size must be in range 64B to 1GiB";
  texts[2] = "average size must be a power of 2";
  texts[3] = "minimum size must be in range 64B to 1GiB";
  texts[4] = "maximum size must be in range 64B to 1GiB";
  texts[5] = "minimum size must be less than maximum size";
  texts[6] = "average size must be between minimum and maximum size";
  texts[7] = "normalization must be 0, 1, 2, or 3";
  texts[8] = "buffer size must exceed maximum size and be at most 2 GiB";
  texts[9] = "average size/normalization combination exceeds mask table";
  texts[10] = "no text";
  return texts[error];
}


/**
 * Optional overrides for a chunker.  Every field starts out unset and is
 * replaced by its default (relative to the average size) when the options are
 * resolved.  The setters can be chained:
 *
 *   ChunkerOptions().WithMinSize(4096).WithMaxSize(65535).WithSeed(666)
 */
struct FASTCDC_EXPORT ChunkerOptions {
  ChunkerOptions()
    : min_size(0)
    , max_size(0)
    , buffer_size(0)
    , normalization(0)
    , disable_normalization(false)
    , seed(0)
  { }

  /**
   * Defaults to average_size / 4
   */
  ChunkerOptions &WithMinSize(const uint64_t size) {
    min_size = size;
    return *this;
  }

  /**
   * Defaults to average_size * 4
   */
  ChunkerOptions &WithMaxSize(const uint64_t size) {
    max_size = size;
    return *this;
  }

  /**
   * Normalization level 0-3, defaults to 2.  Higher levels produce chunks
   * closer to the average size.  Level 0 disables normalization.
   */
  ChunkerOptions &WithNormalization(const int level) {
    normalization = level;
    disable_normalization = (level == 0);
    return *this;
  }

  /**
   * XOR mask for the gear tables, 0 means unseeded.
   */
  ChunkerOptions &WithSeed(const uint64_t value) {
    seed = value;
    return *this;
  }

  /**
   * Size of the read buffer, defaults to max_size * 2.  Must exceed max_size
   * and must not exceed ChunkerParams::kMaxBufferSize.
   */
  ChunkerOptions &WithBufferSize(const uint64_t size) {
    buffer_size = size;
    return *this;
  }

  uint64_t min_size;
  uint64_t max_size;
  uint64_t buffer_size;
  int normalization;
  bool disable_normalization;
  uint64_t seed;
};


/**
 * The resolved and validated chunker configuration.  Only Resolve() creates
 * valid instances.
 */
class FASTCDC_EXPORT ChunkerParams {
 public:
  static const uint64_t kAbsoluteMinSize = 64;
  static const uint64_t kAbsoluteMaxSize = 1024 * 1024 * 1024;
  static const uint64_t kMaxBufferSize = 2 * kAbsoluteMaxSize;
  static const int kDefaultNormalization = 2;

  ChunkerParams()
    : average_size_(0)
    , min_size_(0)
    , max_size_(0)
    , buffer_size_(0)
    , normalization_(0)
    , seed_(0)
  { }

  /**
   * Applies the options on top of the defaults derived from average_size and
   * validates the result.  On failure, params remains untouched.
   */
  static Failures Resolve(const uint64_t average_size,
                          const ChunkerOptions &options,
                          ChunkerParams *params);

  uint64_t average_size() const { return average_size_; }
  uint64_t min_size() const { return min_size_; }
  uint64_t max_size() const { return max_size_; }
  uint64_t buffer_size() const { return buffer_size_; }
  /**
   * Effective normalization level, 0 if normalization is disabled
   */
  unsigned normalization() const { return normalization_; }
  uint64_t seed() const { return seed_; }

 private:
  uint64_t average_size_;
  uint64_t min_size_;
  uint64_t max_size_;
  uint64_t buffer_size_;
  unsigned normalization_;
  uint64_t seed_;
};


/**
 * Reads chunker settings from a key=value configuration file:
 *
 *   FASTCDC_AVG_CHUNK_SIZE   (required)
 *   FASTCDC_MIN_CHUNK_SIZE
 *   FASTCDC_MAX_CHUNK_SIZE
 *   FASTCDC_NORMALIZATION
 *   FASTCDC_SEED
 *   FASTCDC_BUFFER_SIZE
 *
 * Keys that are not present stay unset in options.  The values are not
 * validated here, that happens once the options are resolved.
 */
FASTCDC_EXPORT
bool GetOptionsFromFile(const std::string &config_file,
                        uint64_t *average_size,
                        ChunkerOptions *options);

}  // namespace fastcdc

#endif  // FASTCDC_INGESTION_CHUNKER_PARAMS_H_
