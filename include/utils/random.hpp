#ifndef NETFILE_UTILS_RANDOM_HPP
#define NETFILE_UTILS_RANDOM_HPP

#include <cstddef>
#include <string>

namespace netfile {
namespace utils {

// Bytes of entropy in a generated file identifier
constexpr std::size_t FILE_ID_BYTES = 16;

// ---- IDENTIFIERS AND SECRETS ----
// 16 random bytes, base64url without padding
std::string random_file_id();
// byte_count random bytes, base64url without padding
std::string random_shared_secret(std::size_t byte_count);
// Single URL path segment naming a local path
std::string file_id_from_path(const std::string& path);


// ---- URL ENCODING ----
// Percent-encodes every byte outside the unreserved set
std::string url_escape(const std::string& text);
// Throws MALFORMED_REQUEST on a broken escape sequence
std::string url_unescape(const std::string& text);

} // namespace utils
} // namespace netfile

#endif // NETFILE_UTILS_RANDOM_HPP
