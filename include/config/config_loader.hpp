#ifndef NETFILE_CONFIG_LOADER_HPP
#define NETFILE_CONFIG_LOADER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "server/server_options.hpp"

namespace netfile {
namespace config {

// Contents of a node configuration file
struct NodeConfig {
  server::ServerOptions server;
  // Empty when the file names none
  std::string log_level;
};

// Parses "1024", "64KB", "2 MB", "1g" and similar into bytes
std::optional<std::uint64_t> parse_size(const std::string& text);

// Missing file, malformed JSON or a wrongly typed key throw CONFIG_ERROR.
// Keys absent from the file keep their defaults.
NodeConfig load_config(const std::string& path);
server::ServerOptions load_server_options(const std::string& path);

} // namespace config
} // namespace netfile

#endif // NETFILE_CONFIG_LOADER_HPP
