#include "server/file_server.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>
#include <boost/log/trivial.hpp>
#include "error/status_codes.hpp"
#include "storage/stream_adapters.hpp"
#include "utils/random.hpp"

namespace netfile {
namespace server {

namespace http = boost::beast::http;

namespace {

// Sequential views over a multiplexer cursor

class CursorReader : public storage::Reader {
public:
  explicit CursorReader(mux::ReadMultiplexer::Cursor& cursor) : cursor_(cursor) {}
  storage::IoResult read(char* data, std::size_t size) override { return cursor_.read(data, size); }

private:
  mux::ReadMultiplexer::Cursor& cursor_;
};

class CursorWriter : public storage::Writer {
public:
  explicit CursorWriter(mux::WriteMultiplexer::Cursor& cursor) : cursor_(cursor) {}
  std::size_t write(const char* data, std::size_t size) override { return cursor_.write(data, size); }

private:
  mux::WriteMultiplexer::Cursor& cursor_;
};

class StringWriter : public storage::Writer {
public:
  explicit StringWriter(std::string& target) : target_(target) {}
  std::size_t write(const char* data, std::size_t size) override {
    target_.append(data, size);
    return size;
  }

private:
  std::string& target_;
};

std::string trim(const std::string& text) {
  std::size_t first = 0;
  std::size_t last = text.size();
  while (first < last && std::isspace(static_cast<unsigned char>(text[first]))) ++first;
  while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) --last;
  return text.substr(first, last - first);
}

bool parse_unsigned(const std::string& text, std::uint64_t& value) {
  if (text.empty() || text.size() > 19) {
    return false;
  }
  value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    value = value * 10 + static_cast<std::uint64_t>(c - '0');
  }
  return true;
}

// Returns the decoded value of key in a raw query string, empty when absent
std::string query_value(const std::string& query, const std::string& key) {
  std::size_t start = 0;
  while (start <= query.size()) {
    std::size_t end = query.find('&', start);
    if (end == std::string::npos) {
      end = query.size();
    }

    std::string pair = query.substr(start, end - start);
    std::size_t equals = pair.find('=');
    std::string name = pair.substr(0, equals);
    if (name == key) {
      std::string value = equals == std::string::npos ? "" : pair.substr(equals + 1);
      for (auto& c : value) {
        if (c == '+') c = ' ';
      }
      return utils::url_unescape(value);
    }
    start = end + 1;
  }
  return "";
}

} // namespace


//==============================================
// STANDARD RANGE PARSING
//==============================================

std::optional<ContentRange> parse_content_range(const std::string& value, std::uint64_t size) {
  const std::string prefix = "bytes=";
  std::string text = trim(value);
  if (text.compare(0, prefix.size(), prefix) != 0) {
    return std::nullopt;
  }
  text = trim(text.substr(prefix.size()));

  // Multiple ranges are served as a plain 200
  if (text.find(',') != std::string::npos) {
    return std::nullopt;
  }

  std::size_t dash = text.find('-');
  if (dash == std::string::npos) {
    return std::nullopt;
  }
  std::string first_text = trim(text.substr(0, dash));
  std::string last_text = trim(text.substr(dash + 1));

  ContentRange range;
  if (first_text.empty()) {
    // Suffix form, the last n bytes
    std::uint64_t suffix = 0;
    if (!parse_unsigned(last_text, suffix)) {
      return std::nullopt;
    }
    if (suffix == 0 || size == 0) {
      throw Error(ErrorKind::INVALID_OFFSET, "range not satisfiable");
    }
    range.length = suffix < size ? suffix : size;
    range.first = size - range.length;
    return range;
  }

  std::uint64_t first = 0;
  if (!parse_unsigned(first_text, first)) {
    return std::nullopt;
  }
  std::uint64_t last = size == 0 ? 0 : size - 1;
  if (!last_text.empty()) {
    std::uint64_t requested_last = 0;
    if (!parse_unsigned(last_text, requested_last) || requested_last < first) {
      return std::nullopt;
    }
    if (requested_last < last) {
      last = requested_last;
    }
  }
  if (first >= size) {
    throw Error(ErrorKind::INVALID_OFFSET, "range not satisfiable");
  }

  range.first = first;
  range.length = last - first + 1;
  return range;
}


//==============================================
// CONSTRUCTOR
//==============================================

FileServer::FileServer(Registry& registry, const ServerOptions& options)
  : registry_(registry)
  , options_(options) {
  if (options_.shared_secret.empty()) {
    throw std::invalid_argument("File server: Shared secret must not be empty");
  }
  if (options_.buffer_size == 0) {
    throw std::invalid_argument("File server: Buffer size must not be zero");
  }

  registry_.set_close_handles(options_.close_readers, options_.close_writers);
  BOOST_LOG_TRIVIAL(debug) << "File server: Initialized with prefix '" << options_.url_prefix << "'";
}


//==============================================
// REQUEST DISPATCH
//==============================================

void FileServer::handle(HttpExchange& exchange) {
  const RequestHeader& request = exchange.request();
  std::string target(request.target());

  std::string path = target;
  std::string query;
  std::size_t question = target.find('?');
  if (question != std::string::npos) {
    path = target.substr(0, question);
    query = target.substr(question + 1);
  }

  try {
    if (!options_.url_prefix.empty() && path.compare(0, options_.url_prefix.size(), options_.url_prefix) != 0) {
      BOOST_LOG_TRIVIAL(debug) << "File server: Invalid URL prefix in " << path;
      send_status(exchange, 400);
      return;
    }

    if (!authenticate(request, query)) {
      BOOST_LOG_TRIVIAL(debug) << "File server: Invalid secret for " << request.method_string() << " " << path;
      send_status(exchange, 401);
      return;
    }

    // The remainder must be exactly /<identifier>
    std::string remainder = path.substr(options_.url_prefix.size());
    if (remainder.size() < 2 || remainder[0] != '/' || remainder.find('/', 1) != std::string::npos) {
      BOOST_LOG_TRIVIAL(debug) << "File server: Invalid path " << path;
      send_status(exchange, 400);
      return;
    }
    std::string id = utils::url_unescape(remainder.substr(1));

    BOOST_LOG_TRIVIAL(debug) << "File server: " << request.method_string() << " " << id;

    switch (request.method()) {
      case http::verb::options:
        handle_stat(exchange, id);
        break;
      case http::verb::get:
        handle_read(exchange, id);
        break;
      case http::verb::patch:
        handle_write(exchange, id);
        break;
      case http::verb::put:
        handle_full_write(exchange, id);
        break;
      case http::verb::delete_:
        handle_close(exchange, id);
        break;
      default:
        BOOST_LOG_TRIVIAL(debug) << "File server: Method not allowed: " << request.method_string();
        send_status(exchange, 405);
        break;
    }
  } catch (const std::exception& e) {
    if (exchange.response_started()) {
      // Too late for a status, the session drops the connection
      BOOST_LOG_TRIVIAL(error) << "File server: Failed after response started for " << target << ": " << e.what();
      throw;
    }
    send_error(exchange, e);
  }
}


//==============================================
// REQUEST HANDLERS
//==============================================

void FileServer::handle_stat(HttpExchange& exchange, const std::string& id) {
  storage::FileInfo info = stat_file(id);

  Response response{http::status::ok, exchange.request().version()};
  response.set(http::field::content_type, "application/json");
  response.set(protocol::HEADER_CONTENT_LENGTH, std::to_string(info.size));
  response.body() = storage::encode_file_info(info);
  exchange.send(std::move(response));
}

void FileServer::handle_read(HttpExchange& exchange, const std::string& id) {
  auto reader = registry_.find_reader(id);
  if (!reader) {
    throw Error(ErrorKind::NOT_FOUND);
  }

  auto range_header = exchange.request().find(protocol::HEADER_RANGE);
  if (options_.allow_full_get && range_header == exchange.request().end()) {
    handle_full_read(exchange, id, *reader);
    return;
  }

  handle_ranged_read(exchange, id, *reader);
}

void FileServer::handle_ranged_read(HttpExchange& exchange, const std::string& id, mux::ReadMultiplexer& reader) {
  protocol::ByteRange range = protocol::parse_range_header(std::string(exchange.request()[protocol::HEADER_RANGE]));

  auto cursor = reader.new_cursor();
  cursor.seek(range.offset, storage::Whence::START);

  // Assemble the body first so a storage failure still gets its own status
  std::string body;
  CursorReader cursor_reader(cursor);
  storage::LimitedReader limited(cursor_reader, static_cast<std::uint64_t>(range.length));
  StringWriter sink(body);
  std::vector<char> buffer(std::min<std::size_t>(options_.buffer_size, static_cast<std::size_t>(range.length)));
  std::uint64_t copied = storage::copy_buffer(sink, limited, buffer);

  BOOST_LOG_TRIVIAL(debug) << "File server: Read " << copied << " bytes at " << range.offset << " from " << id;

  Response response{http::status::partial_content, exchange.request().version()};
  response.set(http::field::content_type, "application/octet-stream");
  response.set(protocol::HEADER_RANGE, protocol::format_range_header(range.offset, static_cast<std::int64_t>(copied)));
  response.set(protocol::HEADER_IS_EOF, copied < static_cast<std::uint64_t>(range.length) ? "true" : "false");
  response.body() = std::move(body);
  exchange.send(std::move(response));
}

void FileServer::handle_full_read(HttpExchange& exchange, const std::string& id, mux::ReadMultiplexer& reader) {
  auto cursor = reader.new_cursor();
  auto size = static_cast<std::uint64_t>(cursor.seek(0, storage::Whence::END));

  ResponseHeader header;
  header.version(exchange.request().version());
  header.set(http::field::accept_ranges, "bytes");
  header.set(http::field::content_type, "application/octet-stream");

  std::uint64_t first = 0;
  std::uint64_t length = size;
  header.result(http::status::ok);

  auto range_header = exchange.request().find(http::field::range);
  if (range_header != exchange.request().end()) {
    std::optional<ContentRange> range;
    try {
      range = parse_content_range(std::string(range_header->value()), size);
    } catch (const Error&) {
      BOOST_LOG_TRIVIAL(debug) << "File server: Unsatisfiable range " << range_header->value() << " for " << id;
      Response response{http::status::range_not_satisfiable, exchange.request().version()};
      response.set(http::field::content_range, "bytes */" + std::to_string(size));
      exchange.send(std::move(response));
      return;
    }

    if (range) {
      first = range->first;
      length = range->length;
      header.result(http::status::partial_content);
      header.set(http::field::content_range, "bytes " + std::to_string(first) + "-" +
                 std::to_string(first + length - 1) + "/" + std::to_string(size));
    }
  }

  cursor.seek(static_cast<std::int64_t>(first), storage::Whence::START);
  CursorReader cursor_reader(cursor);
  storage::LimitedReader limited(cursor_reader, length);

  BOOST_LOG_TRIVIAL(debug) << "File server: Serving " << length << " of " << size << " bytes of " << id;
  exchange.send_stream(std::move(header), limited, length);
}

void FileServer::handle_write(HttpExchange& exchange, const std::string& id) {
  protocol::ByteRange range = protocol::parse_range_header(std::string(exchange.request()[protocol::HEADER_RANGE]));

  auto writer = registry_.find_writer(id);
  if (!writer) {
    throw Error(ErrorKind::NOT_FOUND);
  }

  auto cursor = writer->new_cursor();
  cursor.seek(range.offset, storage::Whence::START);

  // Never write past the declared range, a longer body is rejected below
  CursorWriter cursor_writer(cursor);
  storage::LimitedReader limited(exchange.body(), static_cast<std::uint64_t>(range.length));
  std::vector<char> buffer(std::min<std::size_t>(options_.buffer_size, static_cast<std::size_t>(range.length)));
  std::uint64_t written = storage::copy_buffer(cursor_writer, limited, buffer);

  char extra;
  bool longer = written == static_cast<std::uint64_t>(range.length) && exchange.body().read(&extra, 1).bytes > 0;
  if (written != static_cast<std::uint64_t>(range.length) || longer) {
    BOOST_LOG_TRIVIAL(debug) << "File server: Body length mismatch for " << id << ", declared " << range.length;
    throw Error(ErrorKind::BODY_LENGTH_MISMATCH);
  }

  BOOST_LOG_TRIVIAL(debug) << "File server: Wrote " << written << " bytes at " << range.offset << " to " << id;

  Response response{http::status::no_content, exchange.request().version()};
  response.set(protocol::HEADER_RANGE, protocol::format_range_header(range.offset, static_cast<std::int64_t>(written)));
  exchange.send(std::move(response));
}

void FileServer::handle_full_write(HttpExchange& exchange, const std::string& id) {
  if (!options_.allow_put) {
    BOOST_LOG_TRIVIAL(debug) << "File server: PUT disabled, rejecting " << id;
    send_status(exchange, 403);
    return;
  }

  auto writer = registry_.find_writer(id);
  if (!writer) {
    throw Error(ErrorKind::NOT_FOUND);
  }

  std::vector<char> buffer(options_.buffer_size);
  std::uint64_t written = writer->exclusive([&](storage::WriteSeeker& handle) {
    return storage::copy_buffer(handle, exchange.body(), buffer);
  });

  BOOST_LOG_TRIVIAL(debug) << "File server: Full write of " << written << " bytes to " << id;
  send_status(exchange, 204);
}

void FileServer::handle_close(HttpExchange& exchange, const std::string& id) {
  if (!options_.allow_close) {
    BOOST_LOG_TRIVIAL(debug) << "File server: Close disabled, rejecting " << id;
    send_status(exchange, 403);
    return;
  }

  if (registry_.close(id) == 0) {
    throw Error(ErrorKind::NOT_FOUND);
  }
  send_status(exchange, 204);
}


//==============================================
// HELPERS
//==============================================

bool FileServer::authenticate(const RequestHeader& request, const std::string& query) const {
  std::string secret(request[protocol::HEADER_SHARED_SECRET]);
  if (secret.empty()) {
    secret = query_value(query, protocol::QUERY_SHARED_SECRET);
  }
  return secret == options_.shared_secret;
}

storage::FileInfo FileServer::stat_file(const std::string& id) {
  if (!options_.allow_stat) {
    throw Error(ErrorKind::UNSUPPORTED_OPERATION);
  }

  ExposedHandle handle = registry_.find_any(id);
  if (!handle) {
    throw Error(ErrorKind::NOT_FOUND);
  }

  auto stat = [](auto& target) {
    auto* statter = dynamic_cast<storage::Statter*>(&target);
    if (!statter) {
      throw Error(ErrorKind::UNSUPPORTED_OPERATION);
    }
    return statter->stat();
  };

  storage::FileInfo info;
  try {
    info = handle.reader ? handle.reader->inspect(stat) : handle.writer->inspect(stat);
  } catch (const Error& e) {
    if (e.kind() != ErrorKind::UNSUPPORTED_OPERATION) {
      BOOST_LOG_TRIVIAL(error) << "File server: Error statting " << id << ": " << e.what();
    }
    throw;
  }

  if (!options_.disclose_filenames) {
    info.name = id;
  }
  return info;
}

void FileServer::send_status(HttpExchange& exchange, unsigned status, const std::string& body) {
  Response response;
  response.version(exchange.request().version());
  response.result(status);
  if (!body.empty()) {
    response.set(http::field::content_type, "text/plain; charset=utf-8");
    response.body() = body;
  }
  exchange.send(std::move(response));
}

void FileServer::send_error(HttpExchange& exchange, const std::exception& error) {
  std::string body;
  unsigned status = status_for_exception(error, body);

  if (status == HTTP_CODE_UNKNOWN_ERROR) {
    BOOST_LOG_TRIVIAL(error) << "File server: Unmapped error for " << exchange.request().target() << ": " << error.what();
  } else {
    BOOST_LOG_TRIVIAL(debug) << "File server: Answering " << status << " for " << exchange.request().target();
  }
  send_status(exchange, status, body);
}

} // namespace server
} // namespace netfile
