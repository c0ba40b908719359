#ifndef NETFILE_SERVER_OPTIONS_HPP
#define NETFILE_SERVER_OPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace netfile {
namespace server {

constexpr std::size_t DEFAULT_BUFFER_SIZE = 32 * 1024;
constexpr std::size_t DEFAULT_SECRET_BYTES = 32;

struct ServerOptions {
  // Network parameters, port 0 picks an ephemeral port
  std::string address = "127.0.0.1";
  uint16_t port = 0;
  // Path prefix every request must start with, empty for none
  std::string url_prefix;

  // Generated when left empty
  std::string shared_secret;

  // Feature flags
  bool allow_stat = true;
  bool allow_close = true;
  bool allow_full_get = true;
  bool allow_put = true;
  // Reports the handle's own name instead of the identifier
  bool disclose_filenames = true;
  // Call close() on handles when they are removed
  bool close_readers = true;
  bool close_writers = true;

  // Largest accepted request body, 0 for unlimited
  std::uint64_t max_body_size = 0;
  // Copy chunk for streamed bodies
  std::size_t buffer_size = DEFAULT_BUFFER_SIZE;
};

} // namespace server
} // namespace netfile

#endif // NETFILE_SERVER_OPTIONS_HPP
