/**
 * This file is part of libfastcdc.
 */

#include "ingestion/read_buffer.h"

#include <inttypes.h>

#include <cstring>

#include "ingestion/ingestion_source.h"
#include "util/exception.h"
#include "util/logging.h"
#include "util/smalloc.h"

namespace fastcdc {

ReadBuffer::ReadBuffer(const uint64_t capacity)
  : capacity_(capacity)
  , buffer_(static_cast<unsigned char *>(smalloc(capacity)))
  , source_(NULL)
  , cursor_(capacity)
  , end_(capacity)
  , stream_position_(0)
  , is_exhausted_(false)
  , last_error_(0)
{ }


bool ReadBuffer::Fill(const uint64_t min_available) {
  const uint64_t available = end_ - cursor_;
  if (available >= min_available)
    return true;

  unsigned char *buffer = buffer_.weak_ref();
  if ((available > 0) && (cursor_ > 0))
    memmove(buffer, buffer + cursor_, available);
  cursor_ = 0;
  end_ = available;

  if (is_exhausted_)
    return true;
  if (source_ == NULL)
    PANIC(kLogStderr, "read buffer has no source");

  while (end_ < capacity_) {
    const size_t nbytes = capacity_ - end_;
    const ssize_t nread = source_->Read(buffer + end_, nbytes);
    if (nread < 0) {
      last_error_ = nread;
      LogFastcdc(kLogIngestion, kLogDebug,
                 "read from %s failed at position %" PRIu64 " (%zd)",
                 source_->GetPath().c_str(), stream_position_ + end_, nread);
      return false;
    }
    if (nread == 0) {
      is_exhausted_ = true;
      break;
    }
    if (static_cast<size_t>(nread) > nbytes) {
      PANIC(kLogStderr, "source %s returned %zd bytes, requested %zu",
            source_->GetPath().c_str(), nread, nbytes);
    }
    end_ += nread;
  }

  return true;
}


void ReadBuffer::Advance(const uint64_t nbytes) {
  if (nbytes > size()) {
    PANIC(kLogStderr, "cannot advance by %" PRIu64 " bytes, %" PRIu64 " left",
          nbytes, size());
  }
  cursor_ += nbytes;
  stream_position_ += nbytes;
}


void ReadBuffer::Reset(IngestionSource *source) {
  source_ = source;
  cursor_ = capacity_;
  end_ = capacity_;
  stream_position_ = 0;
  is_exhausted_ = false;
  last_error_ = 0;
}

}  // namespace fastcdc
