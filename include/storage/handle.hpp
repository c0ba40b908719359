#ifndef NETFILE_STORAGE_HANDLE_HPP
#define NETFILE_STORAGE_HANDLE_HPP

#include <cstddef>
#include <cstdint>
#include "storage/file_info.hpp"

namespace netfile {
namespace storage {

enum class Whence {
  START,
  CURRENT,
  END
};

struct IoResult {
  std::size_t bytes = 0;
  // Set once the stream has nothing more to give, may come with bytes > 0
  bool eof = false;
};

// Capability interfaces of an exposed handle. Failures are thrown as netfile::Error.

class Reader {
public:
  virtual ~Reader() = default;
  virtual IoResult read(char* data, std::size_t size) = 0;
};

class Writer {
public:
  virtual ~Writer() = default;
  // Returns the number of bytes written
  virtual std::size_t write(const char* data, std::size_t size) = 0;
};

class Seeker {
public:
  virtual ~Seeker() = default;
  // Returns the new absolute offset
  virtual std::int64_t seek(std::int64_t offset, Whence whence) = 0;
};

class ReaderAt {
public:
  virtual ~ReaderAt() = default;
  virtual IoResult read_at(char* data, std::size_t size, std::int64_t offset) = 0;
};

class WriterAt {
public:
  virtual ~WriterAt() = default;
  virtual std::size_t write_at(const char* data, std::size_t size, std::int64_t offset) = 0;
};

class Statter {
public:
  virtual ~Statter() = default;
  virtual FileInfo stat() = 0;
};

class Closer {
public:
  virtual ~Closer() = default;
  virtual void close() = 0;
};

class ReadSeeker : public virtual Reader, public virtual Seeker {};

class WriteSeeker : public virtual Writer, public virtual Seeker {};

} // namespace storage
} // namespace netfile

#endif // NETFILE_STORAGE_HANDLE_HPP
