#ifndef NETFILE_CLIENT_URL_HPP
#define NETFILE_CLIENT_URL_HPP

#include <cstdint>
#include <string>

namespace netfile {
namespace client {

// Base URL of a file server, http://host[:port][/prefix]
struct Url {
  std::string host;
  uint16_t port = 80;
  // Path before the identifier segment, no trailing slash
  std::string prefix;

  // Throws MALFORMED_REQUEST for anything but a plain http URL
  static Url parse(const std::string& text);

  // host:port, bracketed for IPv6 literals
  std::string authority() const;
  std::string to_string() const;
  // Request target naming an identifier
  std::string target_for(const std::string& id) const;
};

} // namespace client
} // namespace netfile

#endif // NETFILE_CLIENT_URL_HPP
