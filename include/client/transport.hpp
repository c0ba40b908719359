#ifndef NETFILE_CLIENT_TRANSPORT_HPP
#define NETFILE_CLIENT_TRANSPORT_HPP

#include <memory>
#include <boost/beast/http.hpp>
#include "client/url.hpp"
#include "context/context.hpp"

namespace netfile {
namespace client {

using Request = boost::beast::http::request<boost::beast::http::string_body>;
using Response = boost::beast::http::response<boost::beast::http::string_body>;

// Performs one HTTP exchange. Injected into every remote handle, there is no
// process wide default.
class Transport {
public:
  virtual ~Transport() = default;

  // Throws CANCELLED or DEADLINE_EXCEEDED when the context ends first,
  // IO_ERROR when the exchange fails. Any status code is a valid response.
  virtual Response round_trip(const Url& server, Request request, const std::shared_ptr<Context>& context) = 0;
};

} // namespace client
} // namespace netfile

#endif // NETFILE_CLIENT_TRANSPORT_HPP
