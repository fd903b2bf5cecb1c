/**
 * This file is part of libfastcdc.
 *
 * A simple linear congruential pseudo number generator.  Thread-safe since
 * there is no global state like with random().  Used to produce reproducible
 * test streams.
 */

#ifndef FASTCDC_UTIL_PRNG_H_
#define FASTCDC_UTIL_PRNG_H_

#include <stdint.h>

#include <cstddef>

namespace fastcdc {

/**
 * Pseudo Random Number Generator.  See: TAoCP, volume 2
 */
class Prng {
 public:
  // Cannot throw an exception
  Prng() throw() {
    state_ = 0;
  }

  void InitSeed(const uint64_t seed) {
    state_ = seed;
  }

  /**
   * Returns random number in [0..boundary-1]
   */
  uint32_t Next(const uint64_t boundary) {
    state_ = a*state_ + c;
    double scaled_val =
      static_cast<double>(state_) * static_cast<double>(boundary) /
      static_cast<double>(18446744073709551616.0);
    return static_cast<uint32_t>(static_cast<uint64_t>(scaled_val) % boundary);
  }

  /**
   * Fills size bytes of buffer with random octets
   */
  void FillBytes(unsigned char *buffer, const size_t size) {
    for (size_t i = 0; i < size; ++i)
      buffer[i] = static_cast<unsigned char>(Next(256));
  }

 private:
  // Magic numbers from MMIX
  // static const uint64_t m = 2^64;
  static const uint64_t a = 6364136223846793005LLU;
  static const uint64_t c = 1442695040888963407LLU;
  uint64_t state_;
};  // class Prng

}  // namespace fastcdc

#endif  // FASTCDC_UTIL_PRNG_H_
