/**
 * This file is part of libfastcdc.
 */

#ifndef FASTCDC_INGESTION_INGESTION_SOURCE_H_
#define FASTCDC_INGESTION_INGESTION_SOURCE_H_

#include <stdint.h>
#include <sys/types.h>

#include <string>

#include "util/export.h"
#include "util/single_copy.h"

namespace fastcdc {

/**
 * Common interface for the byte streams that are fed into a Chunker.  A source
 * is a sequential, blocking reader.  Read() returns up to nbyte bytes, fewer
 * only at the end of the stream, and 0 once the stream is exhausted.  A
 * negative return value is -errno of the failed operation.
 *
 * The chunker only ever calls Read().  Opening, closing and deleting the
 * source is the business of whoever created it.
 */
class FASTCDC_EXPORT IngestionSource : SingleCopy {
 public:
  virtual ~IngestionSource() {}
  virtual std::string GetPath() const = 0;
  virtual bool IsRealFile() const = 0;
  virtual bool Open() = 0;
  virtual ssize_t Read(void *buffer, size_t nbyte) = 0;
  virtual bool Close() = 0;
  virtual bool GetSize(uint64_t *size) = 0;
};


class FASTCDC_EXPORT FileIngestionSource : public IngestionSource {
 public:
  explicit FileIngestionSource(const std::string &path)
    : path_(path), fd_(-1) {}
  virtual ~FileIngestionSource() { Close(); }

  virtual std::string GetPath() const { return path_; }
  virtual bool IsRealFile() const { return true; }
  virtual bool Open();
  virtual ssize_t Read(void *buffer, size_t nbyte);
  virtual bool Close();
  virtual bool GetSize(uint64_t *size);

 private:
  const std::string path_;
  int fd_;
};


/**
 * Wraps around existing memory without owning it.
 */
class FASTCDC_EXPORT MemoryIngestionSource : public IngestionSource {
 public:
  MemoryIngestionSource(
    const std::string &p, const unsigned char *d, uint64_t s)
    : path_(p), data_(d), size_(s), pos_(0) {}
  virtual ~MemoryIngestionSource() {}
  virtual std::string GetPath() const { return path_; }
  virtual bool IsRealFile() const { return false; }
  virtual bool Open() { pos_ = 0; return true; }
  virtual ssize_t Read(void *buffer, size_t nbyte);
  virtual bool Close() { return true; }
  virtual bool GetSize(uint64_t *size) { *size = size_; return true; }

 private:
  std::string path_;
  const unsigned char *data_;
  uint64_t size_;
  uint64_t pos_;
};


/**
 * Uses an std::string as data buffer
 */
class FASTCDC_EXPORT StringIngestionSource : public IngestionSource {
 public:
  explicit StringIngestionSource(const std::string &data)
    : data_(data),
      source_("MEM", reinterpret_cast<const unsigned char *>(data_.data()),
              data_.length()) {}
  StringIngestionSource(const std::string &data, const std::string &filename)
    : data_(data),
      source_(filename, reinterpret_cast<const unsigned char *>(data_.data()),
              data_.length()) {}
  virtual ~StringIngestionSource() {}
  virtual std::string GetPath() const { return source_.GetPath(); }
  virtual bool IsRealFile() const { return false; }
  virtual bool Open() { return source_.Open(); }
  virtual ssize_t Read(void *buffer, size_t nbyte) {
    return source_.Read(buffer, nbyte);
  }
  virtual bool Close() { return source_.Close(); }
  virtual bool GetSize(uint64_t *size) { return source_.GetSize(size); }

 private:
  std::string data_;
  MemoryIngestionSource source_;
};

}  // namespace fastcdc

#endif  // FASTCDC_INGESTION_INGESTION_SOURCE_H_
