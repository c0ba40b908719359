#include "server/http_server.hpp"
#include <algorithm>
#include <iterator>
#include <boost/log/trivial.hpp>

namespace netfile {
namespace server {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(FileServer& file_server, const std::string& address, uint16_t port)
  : address_(address)
  , port_(port)
  , file_server_(file_server) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing HTTP server on " << address << ":" << port;
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    io_context_.restart();
    boost::asio::ip::tcp::endpoint endpoint(boost::asio::ip::make_address(address_), port_);
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    bound_port_ = acceptor_->local_endpoint().port();

    is_running_ = true;

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Starting to accept connections";
    start_accept();

    // Accepting runs on the io_context thread, sessions on their own threads
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Server started successfully on " << address_ << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    acceptor_.reset();
    return false;
  }
}

void HttpServer::shutdown() {
  bool was_running = is_running_.exchange(false);
  if (!was_running && !io_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";

  // Stop the accept loop, the acceptor is safe to close once no thread runs it
  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();

  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  }

  // Unblock every live session, then wait for them
  std::vector<SessionThread> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions.swap(sessions_);
  }
  for (auto& entry : sessions) {
    entry.session->stop();
  }
  for (auto& entry : sessions) {
    if (entry.thread.joinable()) {
      entry.thread.join();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete, closed " << sessions.size() << " connections";
}


//==============================================
// CONNECTION HANDLING
//==============================================

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  acceptor_->async_accept(
    [this](const boost::system::error_code& error, boost::asio::ip::tcp::socket socket) {
      if (!error) {
        start_session(std::move(socket));
      } else if (error != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void HttpServer::start_session(boost::asio::ip::tcp::socket socket) {
  reap_sessions();

  if (!is_running_) {
    boost::system::error_code ec;
    socket.close(ec);
    return;
  }

  try {
    auto session = std::make_shared<HttpSession>(std::move(socket), file_server_);

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.push_back(SessionThread{session, std::thread()});
    sessions_.back().thread = std::thread([session]() { session->run(); });
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start session: " << e.what();
  }
}

void HttpServer::reap_sessions() {
  std::vector<SessionThread> done;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto split = std::partition(sessions_.begin(), sessions_.end(),
                                [](const SessionThread& entry) { return !entry.session->finished(); });
    std::move(split, sessions_.end(), std::back_inserter(done));
    sessions_.erase(split, sessions_.end());
  }

  for (auto& entry : done) {
    if (entry.thread.joinable()) {
      entry.thread.join();
    }
  }
}

std::size_t HttpServer::session_count() {
  reap_sessions();
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

} // namespace server
} // namespace netfile
