#ifndef NETFILE_SERVER_HTTP_SESSION_HPP
#define NETFILE_SERVER_HTTP_SESSION_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "server/file_server.hpp"
#include "server/http_exchange.hpp"

namespace netfile {
namespace server {

class HttpSession;

// Pulls the request body of the current exchange off the socket
class RequestBodyReader : public storage::Reader {
public:
  explicit RequestBodyReader(HttpSession& session) : session_(session) {}
  storage::IoResult read(char* data, std::size_t size) override;

private:
  HttpSession& session_;
};

// One accepted connection, serving HTTP/1.1 requests in order until the peer
// goes away or keep-alive ends. run() blocks and is meant for its own thread.
class HttpSession : public HttpExchange {
public:
  // Delete copy constructor and assignment operator
  HttpSession(const HttpSession&) = delete;
  HttpSession& operator=(const HttpSession&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  HttpSession(boost::asio::ip::tcp::socket socket, FileServer& file_server);
  ~HttpSession() override;


  // ---- CONNECTION LIFECYCLE ----
  void run();
  // Unblocks run() from another thread
  void stop();
  bool finished() const { return finished_; }


  // ---- EXCHANGE ----
  const RequestHeader& request() const override;
  storage::Reader& body() override { return body_reader_; }
  void send(Response&& response) override;
  void send_stream(ResponseHeader&& header, storage::Reader& source, std::uint64_t length) override;
  bool response_started() const override { return response_started_; }

private:
  friend class RequestBodyReader;

  using Parser = boost::beast::http::request_parser<boost::beast::http::buffer_body>;

  // Returns false when the connection should close
  bool serve_request();
  storage::IoResult read_body(char* data, std::size_t size);
  // Keep-alive only survives if the whole request body was consumed
  bool keep_alive() const;
  void send_too_large();

  // ---- PARAMETERS ----
  boost::asio::ip::tcp::socket socket_;
  boost::beast::flat_buffer buffer_;
  FileServer& file_server_;

  std::optional<Parser> parser_;
  RequestBodyReader body_reader_;
  bool response_started_ = false;
  bool response_done_ = false;

  std::atomic<bool> finished_{false};
  std::mutex socket_mutex_;
};

} // namespace server
} // namespace netfile

#endif // NETFILE_SERVER_HTTP_SESSION_HPP
