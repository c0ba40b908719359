#include "protocol/headers.hpp"
#include <cctype>
#include <limits>
#include "error/netfile_error.hpp"

namespace netfile {
namespace protocol {

namespace {

std::string trim(const std::string& text) {
  std::size_t first = 0;
  std::size_t last = text.size();
  while (first < last && std::isspace(static_cast<unsigned char>(text[first]))) ++first;
  while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) --last;
  return text.substr(first, last - first);
}

// Parses a signed decimal starting at pos, advancing pos past it
bool parse_decimal(const std::string& text, std::size_t& pos, std::int64_t& value) {
  bool negative = false;
  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    negative = text[pos] == '-';
    ++pos;
  }

  std::size_t digits = 0;
  std::uint64_t magnitude = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    magnitude = magnitude * 10 + static_cast<std::uint64_t>(text[pos] - '0');
    if (magnitude > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return false;
    }
    ++pos;
    ++digits;
  }
  if (digits == 0) {
    return false;
  }

  value = negative ? -static_cast<std::int64_t>(magnitude) : static_cast<std::int64_t>(magnitude);
  return true;
}

} // namespace

ByteRange parse_range_header(const std::string& value) {
  std::string text = trim(value);
  ByteRange range;
  std::size_t pos = 0;

  if (!parse_decimal(text, pos, range.offset) || pos >= text.size() || text[pos++] != '-' ||
      !parse_decimal(text, pos, range.length) || pos != text.size()) {
    throw Error(ErrorKind::MALFORMED_REQUEST, "error parsing range header");
  }
  if (range.offset < 0) {
    throw Error(ErrorKind::MALFORMED_REQUEST, "invalid offset");
  }
  if (range.length < MINIMUM_BUFFER_SIZE) {
    throw Error(ErrorKind::MALFORMED_REQUEST, "invalid buffer length");
  }
  return range;
}

std::string format_range_header(std::int64_t offset, std::int64_t length) {
  return std::to_string(offset) + "-" + std::to_string(length);
}

} // namespace protocol
} // namespace netfile
