#include "config/config_loader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include "error/netfile_error.hpp"

namespace netfile {
namespace config {

namespace {

template <typename T>
void assign(T& target, const nlohmann::json& document, const char* key) {
  if (!document.contains(key)) {
    return;
  }
  try {
    target = document.at(key).get<T>();
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Config loader: Invalid value for '" << key << "': " << e.what();
    throw Error(ErrorKind::CONFIG_ERROR, std::string("invalid value for '") + key + "'");
  }
}

// Sizes are either a plain number of bytes or a size string
template <typename T>
void assign_size(T& target, const nlohmann::json& document, const char* key) {
  if (!document.contains(key)) {
    return;
  }

  const auto& value = document.at(key);
  if (value.is_number_unsigned()) {
    target = value.get<T>();
    return;
  }
  if (value.is_string()) {
    if (auto bytes = parse_size(value.get<std::string>())) {
      target = static_cast<T>(*bytes);
      return;
    }
  }

  BOOST_LOG_TRIVIAL(error) << "Config loader: Invalid size for '" << key << "': " << value.dump();
  throw Error(ErrorKind::CONFIG_ERROR, std::string("invalid size for '") + key + "'");
}

} // namespace

std::optional<std::uint64_t> parse_size(const std::string& text) {
  std::size_t i = 0;
  std::uint64_t value = 0;
  std::size_t digits = 0;

  while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
    value = value * 10 + static_cast<std::uint64_t>(text[i] - '0');
    ++i;
    if (++digits > 18) {
      return std::nullopt;
    }
  }
  if (digits == 0) {
    return std::nullopt;
  }

  // Optional space between number and unit
  while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
    ++i;
  }

  std::string unit = text.substr(i);
  std::transform(unit.begin(), unit.end(), unit.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (unit.empty()) {
    return value;
  }

  static const std::map<std::string, std::uint64_t> multipliers = {
    {"b", 1ULL},
    {"k", 1024ULL}, {"kb", 1024ULL},
    {"m", 1024ULL * 1024ULL}, {"mb", 1024ULL * 1024ULL},
    {"g", 1024ULL * 1024ULL * 1024ULL}, {"gb", 1024ULL * 1024ULL * 1024ULL},
  };
  auto it = multipliers.find(unit);
  if (it == multipliers.end()) {
    BOOST_LOG_TRIVIAL(warning) << "Config loader: Unknown size unit '" << unit << "' in '" << text << "'";
    return std::nullopt;
  }
  return value * it->second;
}

NodeConfig load_config(const std::string& path) {
  BOOST_LOG_TRIVIAL(info) << "Config loader: Loading configuration from " << path;

  std::ifstream stream(path);
  if (!stream.is_open()) {
    BOOST_LOG_TRIVIAL(error) << "Config loader: Failed to open " << path;
    throw Error(ErrorKind::CONFIG_ERROR, "cannot open config file: " + path);
  }

  nlohmann::json document;
  try {
    stream >> document;
  } catch (const nlohmann::json::parse_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Config loader: Malformed JSON in " << path << ": " << e.what();
    throw Error(ErrorKind::CONFIG_ERROR, "malformed config file: " + path);
  }
  if (!document.is_object()) {
    throw Error(ErrorKind::CONFIG_ERROR, "config file must hold a JSON object: " + path);
  }

  NodeConfig config;
  auto& options = config.server;
  assign(options.address, document, "address");
  std::int64_t port = options.port;
  assign(port, document, "port");
  if (port < 0 || port > 65535) {
    throw Error(ErrorKind::CONFIG_ERROR, "port out of range: " + std::to_string(port));
  }
  options.port = static_cast<uint16_t>(port);
  assign(options.url_prefix, document, "url_prefix");
  assign(options.shared_secret, document, "shared_secret");
  assign(options.allow_stat, document, "allow_stat");
  assign(options.allow_close, document, "allow_close");
  assign(options.allow_full_get, document, "allow_full_get");
  assign(options.allow_put, document, "allow_put");
  assign(options.disclose_filenames, document, "disclose_filenames");
  assign(options.close_readers, document, "close_readers");
  assign(options.close_writers, document, "close_writers");
  assign_size(options.max_body_size, document, "max_body_size");
  assign_size(options.buffer_size, document, "buffer_size");
  assign(config.log_level, document, "log_level");

  if (options.buffer_size == 0) {
    throw Error(ErrorKind::CONFIG_ERROR, "buffer_size must not be zero");
  }
  if (!options.url_prefix.empty() && options.url_prefix[0] != '/') {
    throw Error(ErrorKind::CONFIG_ERROR, "url_prefix must start with '/'");
  }

  return config;
}

server::ServerOptions load_server_options(const std::string& path) {
  return load_config(path).server;
}

} // namespace config
} // namespace netfile
