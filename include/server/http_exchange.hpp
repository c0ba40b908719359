#ifndef NETFILE_SERVER_HTTP_EXCHANGE_HPP
#define NETFILE_SERVER_HTTP_EXCHANGE_HPP

#include <cstdint>
#include <boost/beast/http.hpp>
#include "storage/handle.hpp"

namespace netfile {
namespace server {

using RequestHeader = boost::beast::http::request_header<>;
using ResponseHeader = boost::beast::http::response_header<>;
using Response = boost::beast::http::response<boost::beast::http::string_body>;

// One request/response pair as seen by a handler. The request body is pulled
// on demand, the response is sent exactly once.
class HttpExchange {
public:
  virtual ~HttpExchange() = default;

  virtual const RequestHeader& request() const = 0;
  // Request body, signals eof once the declared body is consumed
  virtual storage::Reader& body() = 0;

  // Sends a complete response
  virtual void send(Response&& response) = 0;
  // Sends header, then exactly length bytes pulled from source
  virtual void send_stream(ResponseHeader&& header, storage::Reader& source, std::uint64_t length) = 0;
  // True once any part of the response went out
  virtual bool response_started() const = 0;
};

} // namespace server
} // namespace netfile

#endif // NETFILE_SERVER_HTTP_EXCHANGE_HPP
