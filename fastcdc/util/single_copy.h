/**
 * This file is part of libfastcdc.
 */

#ifndef FASTCDC_UTIL_SINGLE_COPY_H_
#define FASTCDC_UTIL_SINGLE_COPY_H_

namespace fastcdc {

/**
 * Generic base class to mark an inheriting class as 'non-copyable'.  Chunkers,
 * read buffers and byte sources own raw memory or descriptors.
 */
class SingleCopy {
 protected:
  // Prevent SingleCopy from being instantiated on its own
  SingleCopy() {}

 private:
  // Provoke a linker error by not implementing copy constructor and
  // assignment operator.
  SingleCopy(const SingleCopy &other);
  SingleCopy& operator=(const SingleCopy &rhs);
};

}  // namespace fastcdc

#endif  // FASTCDC_UTIL_SINGLE_COPY_H_
