#include "utils/random.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <stdexcept>
#include <vector>
#include <boost/log/trivial.hpp>
#include "error/netfile_error.hpp"

namespace netfile {
namespace utils {

namespace {

std::string base64url(const std::vector<unsigned char>& bytes) {
  // EVP_EncodeBlock writes 4 chars per 3 bytes plus a terminator
  std::string encoded(4 * ((bytes.size() + 2) / 3) + 1, '\0');
  int length = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                               bytes.data(), static_cast<int>(bytes.size()));
  encoded.resize(static_cast<std::size_t>(length));

  std::replace(encoded.begin(), encoded.end(), '+', '-');
  std::replace(encoded.begin(), encoded.end(), '/', '_');
  encoded.erase(std::find(encoded.begin(), encoded.end(), '='), encoded.end());
  return encoded;
}

std::vector<unsigned char> random_bytes(std::size_t count) {
  std::vector<unsigned char> bytes(count);
  if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Random: RAND_bytes failed for " << count << " bytes";
    throw std::runtime_error("Random: Failed to generate random bytes");
  }
  return bytes;
}

bool is_unreserved(unsigned char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
         c == '-' || c == '_' || c == '.' || c == '~';
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace


//==============================================
// IDENTIFIERS AND SECRETS
//==============================================

std::string random_file_id() {
  return base64url(random_bytes(FILE_ID_BYTES));
}

std::string random_shared_secret(std::size_t byte_count) {
  return base64url(random_bytes(byte_count));
}

std::string file_id_from_path(const std::string& path) {
  return url_escape(path);
}


//==============================================
// URL ENCODING
//==============================================

std::string url_escape(const std::string& text) {
  static const char HEX[] = "0123456789ABCDEF";
  std::string escaped;
  escaped.reserve(text.size());

  for (char ch : text) {
    auto c = static_cast<unsigned char>(ch);
    if (is_unreserved(c)) {
      escaped += ch;
    } else {
      escaped += '%';
      escaped += HEX[c >> 4];
      escaped += HEX[c & 0x0F];
    }
  }
  return escaped;
}

std::string url_unescape(const std::string& text) {
  std::string decoded;
  decoded.reserve(text.size());

  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '%') {
      decoded += text[i];
      continue;
    }
    if (i + 2 >= text.size()) {
      throw Error(ErrorKind::MALFORMED_REQUEST, "invalid URL escape");
    }
    int high = hex_value(text[i + 1]);
    int low = hex_value(text[i + 2]);
    if (high < 0 || low < 0) {
      throw Error(ErrorKind::MALFORMED_REQUEST, "invalid URL escape");
    }
    decoded += static_cast<char>((high << 4) | low);
    i += 2;
  }
  return decoded;
}

} // namespace utils
} // namespace netfile
