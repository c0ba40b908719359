#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "server/file_server.hpp"
#include "server/http_session.hpp"

namespace netfile {
namespace server {

class HttpServer {
public:
  // Delete copy constructor and assignment operator
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  HttpServer(FileServer& file_server, const std::string& address, uint16_t port);
  ~HttpServer();


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  // Stops accepting, drops live connections and joins their threads
  void shutdown();


  // ---- GETTERS ----
  // Bound port, differs from the requested one when that was 0
  uint16_t port() const { return bound_port_; }
  const std::string& address() const { return address_; }
  bool is_running() const { return is_running_; }
  std::size_t session_count();

private:
  struct SessionThread {
    std::shared_ptr<HttpSession> session;
    std::thread thread;
  };

  // ---- CONNECTION HANDLING ----
  // Main listening loop that hands accepted sockets to session threads
  void start_accept();
  void start_session(boost::asio::ip::tcp::socket socket);
  // Joins sessions whose connection already ended
  void reap_sessions();

  // ---- PARAMETERS ----
  // Network parameters
  const std::string address_;
  const uint16_t port_;
  uint16_t bound_port_ = 0;

  // Server state
  std::atomic<bool> is_running_{false};
  std::unique_ptr<std::thread> io_thread_;
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // System components
  FileServer& file_server_;

  // Live connections
  std::vector<SessionThread> sessions_;
  std::mutex sessions_mutex_;
};

} // namespace server
} // namespace netfile
