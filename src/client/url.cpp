#include "client/url.hpp"
#include "error/netfile_error.hpp"
#include "utils/random.hpp"

namespace netfile {
namespace client {

Url Url::parse(const std::string& text) {
  const std::string scheme = "http://";
  if (text.compare(0, scheme.size(), scheme) != 0) {
    throw Error(ErrorKind::MALFORMED_REQUEST, "unsupported URL: " + text);
  }

  std::string rest = text.substr(scheme.size());
  std::size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  Url url;
  if (slash != std::string::npos) {
    url.prefix = rest.substr(slash);
    while (!url.prefix.empty() && url.prefix.back() == '/') {
      url.prefix.pop_back();
    }
  }

  std::string port_text;
  if (!authority.empty() && authority[0] == '[') {
    std::size_t close = authority.find(']');
    if (close == std::string::npos) {
      throw Error(ErrorKind::MALFORMED_REQUEST, "invalid host in URL: " + text);
    }
    url.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') {
        throw Error(ErrorKind::MALFORMED_REQUEST, "invalid host in URL: " + text);
      }
      port_text = authority.substr(close + 2);
    }
  } else {
    std::size_t colon = authority.find(':');
    url.host = authority.substr(0, colon);
    if (colon != std::string::npos) {
      port_text = authority.substr(colon + 1);
    }
  }

  if (url.host.empty()) {
    throw Error(ErrorKind::MALFORMED_REQUEST, "missing host in URL: " + text);
  }

  if (!port_text.empty()) {
    unsigned long port = 0;
    for (char c : port_text) {
      if (c < '0' || c > '9') {
        throw Error(ErrorKind::MALFORMED_REQUEST, "invalid port in URL: " + text);
      }
      port = port * 10 + static_cast<unsigned long>(c - '0');
      if (port > 65535) {
        throw Error(ErrorKind::MALFORMED_REQUEST, "invalid port in URL: " + text);
      }
    }
    url.port = static_cast<uint16_t>(port);
  }

  return url;
}

std::string Url::authority() const {
  std::string name = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  return name + ":" + std::to_string(port);
}

std::string Url::to_string() const {
  return "http://" + authority() + prefix;
}

std::string Url::target_for(const std::string& id) const {
  return prefix + "/" + utils::url_escape(id);
}

} // namespace client
} // namespace netfile
