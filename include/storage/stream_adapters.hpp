#ifndef NETFILE_STORAGE_STREAM_ADAPTERS_HPP
#define NETFILE_STORAGE_STREAM_ADAPTERS_HPP

#include <cstdint>
#include <vector>
#include "storage/handle.hpp"

namespace netfile {
namespace storage {

// Consecutive empty reads tolerated by copy_buffer before giving up
constexpr int MAX_CONSECUTIVE_EMPTY_READS = 100;

// Sequential reader over a ReaderAt. Not safe for concurrent use.
class ReaderAtReader : public Reader {
public:
  explicit ReaderAtReader(ReaderAt& source, std::int64_t offset = 0)
    : source_(source)
    , offset_(offset) {}

  IoResult read(char* data, std::size_t size) override;
  std::int64_t offset() const { return offset_; }

private:
  ReaderAt& source_;
  std::int64_t offset_;
};

// Sequential writer over a WriterAt. Not safe for concurrent use.
class WriterAtWriter : public Writer {
public:
  explicit WriterAtWriter(WriterAt& destination, std::int64_t offset = 0)
    : destination_(destination)
    , offset_(offset) {}

  std::size_t write(const char* data, std::size_t size) override;
  std::int64_t offset() const { return offset_; }

private:
  WriterAt& destination_;
  std::int64_t offset_;
};

// Reads at most limit bytes from source, then signals end of stream
class LimitedReader : public Reader {
public:
  LimitedReader(Reader& source, std::uint64_t limit)
    : source_(source)
    , remaining_(limit) {}

  IoResult read(char* data, std::size_t size) override;
  std::uint64_t remaining() const { return remaining_; }

private:
  Reader& source_;
  std::uint64_t remaining_;
};

// Copies src into dst through buffer until src signals end of stream.
// Returns the number of bytes copied.
std::uint64_t copy_buffer(Writer& dst, Reader& src, std::vector<char>& buffer);

} // namespace storage
} // namespace netfile

#endif // NETFILE_STORAGE_STREAM_ADAPTERS_HPP
