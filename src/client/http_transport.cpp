#include "client/http_transport.hpp"
#include <boost/log/trivial.hpp>
#include "error/netfile_error.hpp"

namespace netfile {
namespace client {

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

// How often a blocked exchange checks its context
constexpr std::chrono::milliseconds POLL_INTERVAL{5};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpTransport::HttpTransport(HttpTransportOptions options)
  : options_(options) {
  BOOST_LOG_TRIVIAL(debug) << "HTTP transport: Created with " << options_.max_idle_connections
                           << " idle connections per host";
}

HttpTransport::~HttpTransport() {
  close_idle_connections();
}


//==============================================
// TRANSPORT
//==============================================

Response HttpTransport::round_trip(const Url& server, Request request, const std::shared_ptr<Context>& context) {
  auto ctx = context ? context : Context::background();
  if (ctx->done()) {
    throw Error(ctx->reason());
  }

  Deadline deadline = deadline_for(ctx);
  std::string key = server.authority();

  request.version(11);
  request.set(http::field::host, key);
  request.keep_alive(true);
  request.prepare_payload();

  auto connection = acquire(key);
  bool reused = connection != nullptr;

  for (;;) {
    if (!connection) {
      connection = connect(server, deadline, ctx);
    }

    boost::system::error_code ec;
    Response response = exchange(*connection, request, deadline, ctx, ec);
    if (!ec) {
      if (response.keep_alive()) {
        release(key, std::move(connection));
      }
      return response;
    }

    // The peer may have closed a pooled connection while it sat idle
    bool expired = ctx->done() || ec == beast::error::timeout ||
                   (deadline && std::chrono::steady_clock::now() >= *deadline);
    if (!reused || expired || request.method() == http::verb::put) {
      fail("exchange", ec, deadline, ctx);
    }

    BOOST_LOG_TRIVIAL(debug) << "HTTP transport: Pooled connection to " << key << " went stale ("
                             << ec.message() << "), retrying on a new one";
    connection.reset();
    reused = false;
  }
}


//==============================================
// CONNECTION POOL
//==============================================

std::unique_ptr<HttpTransport::Connection> HttpTransport::acquire(const std::string& key) {
  std::lock_guard<std::mutex> lock(idle_mutex_);
  auto it = idle_.find(key);
  if (it == idle_.end() || it->second.empty()) {
    return nullptr;
  }

  auto connection = std::move(it->second.back());
  it->second.pop_back();
  return connection;
}

void HttpTransport::release(const std::string& key, std::unique_ptr<Connection> connection) {
  std::lock_guard<std::mutex> lock(idle_mutex_);
  auto& pool = idle_[key];
  if (pool.size() < options_.max_idle_connections) {
    pool.push_back(std::move(connection));
  }
}

std::size_t HttpTransport::idle_connections() {
  std::lock_guard<std::mutex> lock(idle_mutex_);
  std::size_t count = 0;
  for (const auto& pool : idle_) {
    count += pool.second.size();
  }
  return count;
}

void HttpTransport::close_idle_connections() {
  std::map<std::string, std::vector<std::unique_ptr<Connection>>> idle;
  {
    std::lock_guard<std::mutex> lock(idle_mutex_);
    idle.swap(idle_);
  }

  for (auto& pool : idle) {
    for (auto& connection : pool.second) {
      boost::system::error_code ec;
      connection->stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }
  }
}


//==============================================
// EXCHANGE
//==============================================

template <typename Cancel>
void HttpTransport::drive(Connection& connection, const bool& done, const Deadline& deadline,
                          const std::shared_ptr<Context>& context, Cancel&& cancel) {
  bool cancelled = false;
  connection.io.restart();

  while (!done) {
    connection.io.run_for(POLL_INTERVAL);
    if (done) {
      break;
    }
    if (connection.io.stopped()) {
      connection.io.restart();
    }

    bool expired = deadline && std::chrono::steady_clock::now() >= *deadline;
    if (!cancelled && (context->done() || expired)) {
      cancel();
      cancelled = true;
    }
  }
}

std::unique_ptr<HttpTransport::Connection> HttpTransport::connect(const Url& server, const Deadline& deadline,
                                                                  const std::shared_ptr<Context>& context) {
  auto connection = std::make_unique<Connection>();
  tcp::resolver resolver(connection->io);

  boost::system::error_code ec;
  tcp::resolver::results_type endpoints;
  bool done = false;

  resolver.async_resolve(server.host, std::to_string(server.port),
    [&](const boost::system::error_code& error, tcp::resolver::results_type results) {
      ec = error;
      endpoints = results;
      done = true;
    });
  drive(*connection, done, deadline, context, [&resolver]() { resolver.cancel(); });
  if (ec) {
    fail("resolve", ec, deadline, context);
  }

  if (deadline) {
    connection->stream.expires_at(*deadline);
  } else {
    connection->stream.expires_never();
  }

  done = false;
  connection->stream.async_connect(endpoints,
    [&](const boost::system::error_code& error, const tcp::endpoint&) {
      ec = error;
      done = true;
    });
  drive(*connection, done, deadline, context, [&connection]() { connection->stream.cancel(); });
  if (ec) {
    fail("connect", ec, deadline, context);
  }

  BOOST_LOG_TRIVIAL(debug) << "HTTP transport: Connected to " << server.authority();
  return connection;
}

Response HttpTransport::exchange(Connection& connection, Request& request, const Deadline& deadline,
                                 const std::shared_ptr<Context>& context, boost::system::error_code& ec) {
  if (deadline) {
    connection.stream.expires_at(*deadline);
  } else {
    connection.stream.expires_never();
  }
  auto cancel = [&connection]() { connection.stream.cancel(); };

  bool done = false;
  http::async_write(connection.stream, request,
    [&](const boost::system::error_code& error, std::size_t) {
      ec = error;
      done = true;
    });
  drive(connection, done, deadline, context, cancel);
  if (ec) {
    return Response{};
  }

  http::response_parser<http::string_body> parser;
  if (options_.body_limit > 0) {
    parser.body_limit(options_.body_limit);
  } else {
    parser.body_limit(boost::none);
  }

  done = false;
  http::async_read(connection.stream, connection.buffer, parser,
    [&](const boost::system::error_code& error, std::size_t) {
      ec = error;
      done = true;
    });
  drive(connection, done, deadline, context, cancel);
  if (ec) {
    return Response{};
  }

  BOOST_LOG_TRIVIAL(trace) << "HTTP transport: " << request.method_string() << " " << request.target()
                           << " answered " << parser.get().result_int();
  return parser.release();
}

HttpTransport::Deadline HttpTransport::deadline_for(const std::shared_ptr<Context>& context) const {
  Deadline deadline = context->deadline();
  if (options_.request_timeout.count() > 0) {
    auto timeout = std::chrono::steady_clock::now() + options_.request_timeout;
    if (!deadline || timeout < *deadline) {
      deadline = timeout;
    }
  }
  return deadline;
}

void HttpTransport::fail(const char* step, const boost::system::error_code& ec, const Deadline& deadline,
                         const std::shared_ptr<Context>& context) {
  if (context->done()) {
    ErrorKind reason = context->reason();
    BOOST_LOG_TRIVIAL(debug) << "HTTP transport: " << step << " aborted: " << error_kind_to_string(reason);
    throw Error(reason);
  }

  if (ec == beast::error::timeout || (deadline && std::chrono::steady_clock::now() >= *deadline)) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP transport: " << step << " timed out";
    throw Error(ErrorKind::DEADLINE_EXCEEDED);
  }

  BOOST_LOG_TRIVIAL(debug) << "HTTP transport: " << step << " failed: " << ec.message();
  throw Error(ErrorKind::IO_ERROR, std::string("http ") + step + ": " + ec.message());
}

} // namespace client
} // namespace netfile
