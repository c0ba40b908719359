#pragma once

#include <memory>
#include <string>
#include "context/context.hpp"
#include "server/file_server.hpp"
#include "server/http_server.hpp"
#include "server/registry.hpp"
#include "server/server_options.hpp"

namespace netfile {
namespace server {

// Composes the registry, the protocol handler and the HTTP listener
class Service {
public:
  // Delete copy constructor and assignment operator
  Service(const Service&) = delete;
  Service& operator=(const Service&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Generates a shared secret when options carry none
  explicit Service(ServerOptions options);
  ~Service();


  // ---- INITIALIZATION AND DESTRUCTION METHODS ----
  bool start();
  // Stops the listener, then closes every exposed handle
  void shutdown();


  // ---- EXPOSURE ----
  void serve_reader(const std::string& id, std::unique_ptr<storage::ReadSeeker> handle,
                    std::shared_ptr<Context> context = nullptr);
  void serve_writer(const std::string& id, std::unique_ptr<storage::WriteSeeker> handle,
                    std::shared_ptr<Context> context = nullptr);


  // ---- GETTERS ----
  // http://address:port followed by the URL prefix
  std::string base_url() const;
  const std::string& shared_secret() const { return options_.shared_secret; }
  const ServerOptions& options() const { return options_; }
  Registry& registry() { return *registry_; }
  HttpServer& http_server() { return *http_server_; }

private:
  // ---- PARAMETERS ----
  ServerOptions options_;

  // System components
  std::unique_ptr<Registry> registry_;
  std::unique_ptr<FileServer> file_server_;
  std::unique_ptr<HttpServer> http_server_;
};

} // namespace server
} // namespace netfile
