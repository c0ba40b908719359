#ifndef NETFILE_PROTOCOL_HEADERS_HPP
#define NETFILE_PROTOCOL_HEADERS_HPP

#include <cstdint>
#include <string>

namespace netfile {
namespace protocol {

// Headers and parameters shared by server and client
constexpr const char* HEADER_SHARED_SECRET = "X-SharedSecret";
constexpr const char* HEADER_RANGE = "X-Range";
constexpr const char* HEADER_IS_EOF = "X-IsEOF";
constexpr const char* HEADER_CONTENT_LENGTH = "X-Content-Length";
constexpr const char* QUERY_SHARED_SECRET = "shared-secret";

// Smallest length a ranged request may ask for
constexpr std::int64_t MINIMUM_BUFFER_SIZE = 1;

// Value of an X-Range header
struct ByteRange {
  std::int64_t offset = 0;
  std::int64_t length = 0;
};

// Parses "<offset>-<length>", throws MALFORMED_REQUEST describing the problem
ByteRange parse_range_header(const std::string& value);
std::string format_range_header(std::int64_t offset, std::int64_t length);

} // namespace protocol
} // namespace netfile

#endif // NETFILE_PROTOCOL_HEADERS_HPP
