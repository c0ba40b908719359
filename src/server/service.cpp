#include "server/service.hpp"
#include <boost/log/trivial.hpp>
#include "utils/random.hpp"

namespace netfile {
namespace server {

Service::Service(ServerOptions options)
  : options_(std::move(options)) {

  if (options_.shared_secret.empty()) {
    options_.shared_secret = utils::random_shared_secret(DEFAULT_SECRET_BYTES);
    BOOST_LOG_TRIVIAL(info) << "Service: Generated shared secret";
  }

  try {
    registry_ = std::make_unique<Registry>();
    BOOST_LOG_TRIVIAL(debug) << "Service: Registry created successfully";

    file_server_ = std::make_unique<FileServer>(*registry_, options_);
    BOOST_LOG_TRIVIAL(debug) << "Service: File server created successfully";

    http_server_ = std::make_unique<HttpServer>(*file_server_, options_.address, options_.port);
    BOOST_LOG_TRIVIAL(debug) << "Service: HTTP server created successfully";
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Service: Failed to initialize components: " << e.what();
    throw;
  }
}

Service::~Service() {
  shutdown();
}

bool Service::start() {
  if (!http_server_->start_listener()) {
    BOOST_LOG_TRIVIAL(error) << "Service: Failed to start HTTP server";
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "Service: Serving files at " << base_url();
  return true;
}

void Service::shutdown() {
  // Listener first so no request races the registry teardown
  if (http_server_) {
    http_server_->shutdown();
  }
  if (registry_) {
    registry_->shutdown();
  }
}

void Service::serve_reader(const std::string& id, std::unique_ptr<storage::ReadSeeker> handle,
                           std::shared_ptr<Context> context) {
  registry_->register_reader(id, std::move(handle), std::move(context));
}

void Service::serve_writer(const std::string& id, std::unique_ptr<storage::WriteSeeker> handle,
                           std::shared_ptr<Context> context) {
  registry_->register_writer(id, std::move(handle), std::move(context));
}

std::string Service::base_url() const {
  std::string host = options_.address;
  // Bracket IPv6 literals
  if (host.find(':') != std::string::npos) {
    host = "[" + host + "]";
  }
  return "http://" + host + ":" + std::to_string(http_server_->port()) + options_.url_prefix;
}

} // namespace server
} // namespace netfile
