/**
 * This file is part of libfastcdc.
 */

#include "ingestion/ingestion_source.h"

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>

#include "util/logging.h"
#include "util/posix.h"

namespace fastcdc {

bool FileIngestionSource::Open() {
  if (fd_ >= 0)
    return true;
  fd_ = open(path_.c_str(), O_RDONLY);
  if (fd_ < 0) {
    LogFastcdc(kLogIngestion, kLogStderr,
               "failed to open the file: %s (%d)\n %s", path_.c_str(),
               errno, strerror(errno));
    return false;
  }
  return true;
}


ssize_t FileIngestionSource::Read(void *buffer, size_t nbyte) {
  if (fd_ < 0)
    return -EBADF;
  ssize_t retval = SafeRead(fd_, buffer, nbyte);
  if (retval < 0) {
    const int read_errno = errno;
    LogFastcdc(kLogIngestion, kLogStderr,
               "failed to read the file: %s (%d)\n %s",
               path_.c_str(), read_errno, strerror(read_errno));
    return -read_errno;
  }
  return retval;
}


bool FileIngestionSource::Close() {
  if (fd_ == -1) return true;

  int retval = close(fd_);
  fd_ = -1;
  return (retval == 0);
}


bool FileIngestionSource::GetSize(uint64_t *size) {
  struct stat info;
  int retval = (fd_ >= 0) ? fstat(fd_, &info) : stat(path_.c_str(), &info);
  if (retval != 0)
    return false;
  *size = info.st_size;
  return true;
}


//------------------------------------------------------------------------------


ssize_t MemoryIngestionSource::Read(void *buffer, size_t nbyte) {
  const uint64_t remaining = size_ - pos_;
  const size_t size = static_cast<size_t>(
    std::min(remaining, static_cast<uint64_t>(nbyte)));
  if (size > 0) memcpy(buffer, data_ + pos_, size);
  pos_ += size;
  return static_cast<ssize_t>(size);
}

}  // namespace fastcdc
