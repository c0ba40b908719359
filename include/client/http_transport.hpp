#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "client/transport.hpp"

namespace netfile {
namespace client {

struct HttpTransportOptions {
  // Upper bound for one exchange on top of the context deadline, 0 for none
  std::chrono::milliseconds request_timeout{0};
  // Idle keep-alive connections kept per server
  std::size_t max_idle_connections = 8;
  // Largest accepted response body, 0 for unlimited
  std::uint64_t body_limit = 64 * 1024 * 1024;
};

// Boost.Beast transport over plain TCP with a pool of keep-alive connections
class HttpTransport : public Transport {
public:
  // Delete copy constructor and assignment operator
  HttpTransport(const HttpTransport&) = delete;
  HttpTransport& operator=(const HttpTransport&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit HttpTransport(HttpTransportOptions options = HttpTransportOptions{});
  ~HttpTransport() override;


  // ---- TRANSPORT ----
  Response round_trip(const Url& server, Request request, const std::shared_ptr<Context>& context) override;


  // ---- UTILITY METHODS ----
  std::size_t idle_connections();
  void close_idle_connections();

private:
  using Deadline = std::optional<std::chrono::steady_clock::time_point>;

  // Each connection drives its own io_context so calls never share a thread
  struct Connection {
    boost::asio::io_context io;
    boost::beast::tcp_stream stream{io};
    boost::beast::flat_buffer buffer;
  };

  // ---- CONNECTION POOL ----
  std::unique_ptr<Connection> acquire(const std::string& key);
  void release(const std::string& key, std::unique_ptr<Connection> connection);


  // ---- EXCHANGE ----
  std::unique_ptr<Connection> connect(const Url& server, const Deadline& deadline,
                                      const std::shared_ptr<Context>& context);
  Response exchange(Connection& connection, Request& request, const Deadline& deadline,
                    const std::shared_ptr<Context>& context, boost::system::error_code& ec);
  // Runs the connection's io_context until done is set, calling cancel once
  // when the context ends or the deadline passes
  template <typename Cancel>
  void drive(Connection& connection, const bool& done, const Deadline& deadline,
             const std::shared_ptr<Context>& context, Cancel&& cancel);
  Deadline deadline_for(const std::shared_ptr<Context>& context) const;
  // Throws the error matching a failed step
  [[noreturn]] void fail(const char* step, const boost::system::error_code& ec, const Deadline& deadline,
                         const std::shared_ptr<Context>& context);


  // ---- PARAMETERS ----
  const HttpTransportOptions options_;

  // Idle connections per host:port
  std::map<std::string, std::vector<std::unique_ptr<Connection>>> idle_;
  std::mutex idle_mutex_;
};

} // namespace client
} // namespace netfile
