#include "server/http_session.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>
#include <boost/log/trivial.hpp>
#include "error/netfile_error.hpp"
#include "storage/stream_adapters.hpp"

namespace netfile {
namespace server {

namespace http = boost::beast::http;

storage::IoResult RequestBodyReader::read(char* data, std::size_t size) {
  return session_.read_body(data, size);
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, FileServer& file_server)
  : socket_(std::move(socket))
  , file_server_(file_server)
  , body_reader_(*this) {
}

HttpSession::~HttpSession() {
  boost::system::error_code ec;
  socket_.close(ec);
}


//==============================================
// CONNECTION LIFECYCLE
//==============================================

void HttpSession::run() {
  boost::system::error_code ec;
  auto remote = socket_.remote_endpoint(ec);
  BOOST_LOG_TRIVIAL(debug) << "HTTP session: Serving connection from " << remote;

  try {
    while (serve_request()) {
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Dropping connection from " << remote << ": " << e.what();
  }

  {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  }
  BOOST_LOG_TRIVIAL(debug) << "HTTP session: Connection from " << remote << " finished";
  finished_ = true;
}

void HttpSession::stop() {
  std::lock_guard<std::mutex> lock(socket_mutex_);
  boost::system::error_code ec;
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
}

bool HttpSession::serve_request() {
  parser_.emplace();
  std::uint64_t limit = file_server_.options().max_body_size;
  if (limit > 0) {
    parser_->body_limit(limit);
  } else {
    parser_->body_limit(boost::none);
  }
  response_started_ = false;
  response_done_ = false;

  boost::system::error_code ec;
  http::read_header(socket_, buffer_, *parser_, ec);
  if (ec == http::error::end_of_stream || ec == boost::asio::error::eof) {
    return false;
  }
  if (ec == http::error::body_limit) {
    send_too_large();
    return false;
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Failed to read request header: " << ec.message();
    return false;
  }

  if (http::token_list{request()[http::field::expect]}.exists("100-continue")) {
    http::response<http::empty_body> proceed{http::status::continue_, request().version()};
    http::write(socket_, proceed, ec);
    if (ec) {
      return false;
    }
  }

  file_server_.handle(*this);

  if (!response_done_) {
    throw std::logic_error("HTTP session: Handler finished without a response");
  }
  return keep_alive();
}

bool HttpSession::keep_alive() const {
  return parser_->get().keep_alive() && parser_->is_done();
}

void HttpSession::send_too_large() {
  Response response{http::status::bad_request, parser_->get().version()};
  response.set(http::field::content_type, "text/plain; charset=utf-8");
  response.body() = "request body too large";
  response.keep_alive(false);
  response.prepare_payload();

  boost::system::error_code ec;
  http::write(socket_, response, ec);
  BOOST_LOG_TRIVIAL(debug) << "HTTP session: Rejected oversized request body";
}


//==============================================
// EXCHANGE
//==============================================

const RequestHeader& HttpSession::request() const {
  return parser_->get().base();
}

storage::IoResult HttpSession::read_body(char* data, std::size_t size) {
  if (parser_->is_done()) {
    return storage::IoResult{0, true};
  }
  if (size == 0) {
    return storage::IoResult{};
  }

  auto& body = parser_->get().body();
  body.data = data;
  body.size = size;

  boost::system::error_code ec;
  http::read(socket_, buffer_, *parser_, ec);
  if (ec == http::error::need_buffer) {
    ec = {};
  }
  if (ec == http::error::body_limit) {
    throw Error(ErrorKind::MALFORMED_REQUEST, "request body too large");
  }
  if (ec == http::error::partial_message || ec == http::error::end_of_stream) {
    throw Error(ErrorKind::UNEXPECTED_EOF);
  }
  if (ec) {
    throw Error(ErrorKind::IO_ERROR, "reading request body: " + ec.message());
  }

  return storage::IoResult{size - body.size, parser_->is_done()};
}

void HttpSession::send(Response&& response) {
  if (response_started_) {
    throw std::logic_error("HTTP session: Response already sent");
  }
  response_started_ = true;

  response.version(request().version());
  response.keep_alive(keep_alive());
  response.prepare_payload();

  boost::system::error_code ec;
  http::write(socket_, response, ec);
  if (ec) {
    throw Error(ErrorKind::IO_ERROR, "writing response: " + ec.message());
  }
  response_done_ = true;
}

void HttpSession::send_stream(ResponseHeader&& header, storage::Reader& source, std::uint64_t length) {
  if (response_started_) {
    throw std::logic_error("HTTP session: Response already sent");
  }

  http::response<http::buffer_body> response{std::move(header)};
  response.version(request().version());
  response.keep_alive(keep_alive());
  response.content_length(length);
  response.body().data = nullptr;
  response.body().more = true;

  http::response_serializer<http::buffer_body> serializer{response};
  boost::system::error_code ec;

  response_started_ = true;
  http::write_header(socket_, serializer, ec);
  if (ec) {
    throw Error(ErrorKind::IO_ERROR, "writing response header: " + ec.message());
  }

  std::vector<char> chunk(file_server_.options().buffer_size);
  std::uint64_t remaining = length;
  int empty_reads = 0;

  while (remaining > 0) {
    std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(chunk.size(), remaining));
    storage::IoResult result = source.read(chunk.data(), want);

    if (result.bytes == 0) {
      if (result.eof) {
        throw Error(ErrorKind::UNEXPECTED_EOF);
      }
      if (++empty_reads >= storage::MAX_CONSECUTIVE_EMPTY_READS) {
        throw Error(ErrorKind::NO_PROGRESS);
      }
      continue;
    }
    empty_reads = 0;

    response.body().data = chunk.data();
    response.body().size = result.bytes;
    response.body().more = true;
    http::write(socket_, serializer, ec);
    if (ec == http::error::need_buffer) {
      ec = {};
    }
    if (ec) {
      throw Error(ErrorKind::IO_ERROR, "writing response body: " + ec.message());
    }
    remaining -= result.bytes;
  }

  response.body().data = nullptr;
  response.body().size = 0;
  response.body().more = false;
  http::write(socket_, serializer, ec);
  if (ec) {
    throw Error(ErrorKind::IO_ERROR, "finishing response: " + ec.message());
  }
  response_done_ = true;
}

} // namespace server
} // namespace netfile
