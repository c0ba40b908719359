#include "storage/stream_adapters.hpp"
#include <boost/log/trivial.hpp>
#include "error/netfile_error.hpp"

namespace netfile {
namespace storage {

IoResult ReaderAtReader::read(char* data, std::size_t size) {
  IoResult result = source_.read_at(data, size, offset_);
  offset_ += static_cast<std::int64_t>(result.bytes);
  return result;
}

std::size_t WriterAtWriter::write(const char* data, std::size_t size) {
  std::size_t n = destination_.write_at(data, size, offset_);
  offset_ += static_cast<std::int64_t>(n);
  return n;
}

IoResult LimitedReader::read(char* data, std::size_t size) {
  if (remaining_ == 0) {
    return IoResult{0, true};
  }
  if (size > remaining_) {
    size = static_cast<std::size_t>(remaining_);
  }

  IoResult result = source_.read(data, size);
  remaining_ -= result.bytes;
  if (remaining_ == 0) {
    result.eof = true;
  }
  return result;
}

std::uint64_t copy_buffer(Writer& dst, Reader& src, std::vector<char>& buffer) {
  if (buffer.empty()) {
    throw Error(ErrorKind::SHORT_BUFFER, "copy: empty buffer");
  }

  std::uint64_t total = 0;
  int empty_reads = 0;

  for (;;) {
    IoResult result = src.read(buffer.data(), buffer.size());

    if (result.bytes > 0) {
      empty_reads = 0;
      std::size_t written = dst.write(buffer.data(), result.bytes);
      total += written;
      if (written != result.bytes) {
        BOOST_LOG_TRIVIAL(error) << "Copy: Short write, " << written << " of " << result.bytes << " bytes";
        throw Error(ErrorKind::SHORT_WRITE);
      }
    } else if (!result.eof && ++empty_reads >= MAX_CONSECUTIVE_EMPTY_READS) {
      throw Error(ErrorKind::NO_PROGRESS);
    }

    if (result.eof) {
      break;
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Copy: Copied " << total << " bytes";
  return total;
}

} // namespace storage
} // namespace netfile
