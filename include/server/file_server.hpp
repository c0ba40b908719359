#ifndef NETFILE_SERVER_FILE_SERVER_HPP
#define NETFILE_SERVER_FILE_SERVER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "protocol/headers.hpp"
#include "server/http_exchange.hpp"
#include "server/registry.hpp"
#include "server/server_options.hpp"
#include "storage/file_info.hpp"

namespace netfile {
namespace server {

// Resolved standard Range header against a known size
struct ContentRange {
  std::uint64_t first = 0;
  std::uint64_t length = 0;
};

// Parses "bytes=a-b", "bytes=a-" or "bytes=-n". Returns nullopt when the
// header should be ignored and throws INVALID_OFFSET when unsatisfiable.
std::optional<ContentRange> parse_content_range(const std::string& value, std::uint64_t size);

// Serves the registry over HTTP. Stateless across requests.
class FileServer {
public:
  // Delete copy constructor and assignment operator
  FileServer(const FileServer&) = delete;
  FileServer& operator=(const FileServer&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // options.shared_secret must be set
  FileServer(Registry& registry, const ServerOptions& options);
  ~FileServer() = default;


  // ---- REQUEST DISPATCH ----
  void handle(HttpExchange& exchange);


  // ---- GETTERS ----
  const ServerOptions& options() const { return options_; }

private:
  // ---- REQUEST HANDLERS ----
  void handle_stat(HttpExchange& exchange, const std::string& id);
  void handle_read(HttpExchange& exchange, const std::string& id);
  void handle_ranged_read(HttpExchange& exchange, const std::string& id, mux::ReadMultiplexer& reader);
  void handle_full_read(HttpExchange& exchange, const std::string& id, mux::ReadMultiplexer& reader);
  void handle_write(HttpExchange& exchange, const std::string& id);
  void handle_full_write(HttpExchange& exchange, const std::string& id);
  void handle_close(HttpExchange& exchange, const std::string& id);


  // ---- HELPERS ----
  bool authenticate(const RequestHeader& request, const std::string& query) const;
  storage::FileInfo stat_file(const std::string& id);
  void send_status(HttpExchange& exchange, unsigned status, const std::string& body = "");
  void send_error(HttpExchange& exchange, const std::exception& error);


  // ---- PARAMETERS ----
  Registry& registry_;
  const ServerOptions options_;
};

} // namespace server
} // namespace netfile

#endif // NETFILE_SERVER_FILE_SERVER_HPP
