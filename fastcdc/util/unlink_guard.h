/**
 * This file is part of libfastcdc.
 */

#ifndef FASTCDC_UTIL_UNLINK_GUARD_H_
#define FASTCDC_UTIL_UNLINK_GUARD_H_

#include <unistd.h>

#include <string>

#include "util/single_copy.h"

namespace fastcdc {

/**
 * RAII object to call `unlink()` on a containing file when it gets out of scope
 */
class UnlinkGuard : SingleCopy {
 public:
  inline UnlinkGuard() : enabled_(false) {}
  inline explicit UnlinkGuard(const std::string &path)
    : path_(path), enabled_(true) {}
  inline ~UnlinkGuard() { if (enabled_) unlink(path_.c_str()); }

  inline void Set(const std::string &path) { path_ = path; enabled_ = true; }
  inline void Disable() { enabled_ = false; }

  const std::string& path() const { return path_; }

 private:
  std::string  path_;
  bool         enabled_;
};

}  // namespace fastcdc

#endif  // FASTCDC_UTIL_UNLINK_GUARD_H_
