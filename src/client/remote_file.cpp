#include "client/remote_file.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "error/status_codes.hpp"
#include "protocol/headers.hpp"
#include "utils/random.hpp"

namespace netfile {
namespace client {

namespace http = boost::beast::http;

//==============================================
// REMOTE FILE
//==============================================

RemoteFile::RemoteFile(std::shared_ptr<Transport> transport, const std::string& base_url,
                       const std::string& shared_secret, const std::string& id, std::shared_ptr<Context> context)
  : transport_(std::move(transport))
  , server_(Url::parse(base_url))
  , shared_secret_(shared_secret)
  , id_(id)
  , context_(context ? std::move(context) : Context::background()) {
  if (!transport_) {
    throw std::invalid_argument("Remote file: Null transport");
  }
}

void RemoteFile::set_context(std::shared_ptr<Context> context) {
  context_ = context ? std::move(context) : Context::background();
}

storage::FileInfo RemoteFile::stat() {
  Response response = perform(make_request(http::verb::options));
  if (response.result() != http::status::ok) {
    throw error_from_response(response.result_int(), response.body());
  }
  return storage::decode_file_info(response.body());
}

void RemoteFile::close() {
  Response response = perform(make_request(http::verb::delete_));
  if (response.result() != http::status::no_content) {
    throw error_from_response(response.result_int(), response.body());
  }
  BOOST_LOG_TRIVIAL(debug) << "Remote file: Closed " << id_;
}

std::int64_t RemoteFile::seek_offset(std::int64_t offset, storage::Whence whence) {
  std::int64_t target = 0;
  switch (whence) {
    case storage::Whence::START:
      target = offset;
      break;
    case storage::Whence::CURRENT:
      target = offset_ + offset;
      break;
    case storage::Whence::END:
      target = stat().size + offset;
      break;
    default:
      throw Error(ErrorKind::UNSUPPORTED_OPERATION, "invalid whence");
  }

  if (target < 0) {
    throw Error(ErrorKind::INVALID_OFFSET);
  }
  offset_ = target;
  return offset_;
}

Request RemoteFile::make_request(http::verb method) const {
  Request request{method, server_.target_for(id_), 11};
  request.set(protocol::HEADER_SHARED_SECRET, shared_secret_);
  return request;
}

Response RemoteFile::perform(Request request) {
  BOOST_LOG_TRIVIAL(trace) << "Remote file: " << request.method_string() << " " << request.target();
  return transport_->round_trip(server_, std::move(request), context_);
}

std::string RemoteFile::secret_url() const {
  return server_.to_string() + "/" + utils::url_escape(id_) + "?" + protocol::QUERY_SHARED_SECRET + "=" +
         utils::url_escape(shared_secret_);
}


//==============================================
// REMOTE READER
//==============================================

RemoteReader::RemoteReader(std::shared_ptr<Transport> transport, const std::string& base_url,
                           const std::string& shared_secret, const std::string& id,
                           std::shared_ptr<Context> context)
  : RemoteFile(std::move(transport), base_url, shared_secret, id, std::move(context)) {
}

storage::IoResult RemoteReader::read(char* data, std::size_t size) {
  storage::IoResult result = read_at(data, size, offset_);
  offset_ += static_cast<std::int64_t>(result.bytes);
  return result;
}

void RemoteReader::set_max_range(std::size_t max_range) {
  if (max_range == 0) {
    throw std::invalid_argument("Remote reader: Zero max range");
  }
  max_range_ = max_range;
}

storage::IoResult RemoteReader::read_at(char* data, std::size_t size, std::int64_t offset) {
  if (size == 0) {
    return storage::IoResult{};
  }
  if (offset < 0) {
    throw Error(ErrorKind::INVALID_OFFSET);
  }

  std::size_t total = 0;
  while (total < size) {
    std::size_t chunk = std::min(size - total, max_range_);
    storage::IoResult part = fetch_range(data + total, chunk, offset + static_cast<std::int64_t>(total));
    total += part.bytes;
    if (part.eof) {
      return storage::IoResult{total, true};
    }
  }
  return storage::IoResult{total, false};
}

storage::IoResult RemoteReader::fetch_range(char* data, std::size_t size, std::int64_t offset) {
  Request request = make_request(http::verb::get);
  request.set(protocol::HEADER_RANGE, protocol::format_range_header(offset, static_cast<std::int64_t>(size)));
  Response response = perform(std::move(request));

  if (response.result_int() == HTTP_CODE_EOF) {
    return storage::IoResult{0, true};
  }
  if (response.result() != http::status::partial_content) {
    throw error_from_response(response.result_int(), response.body());
  }

  const std::string& body = response.body();
  if (body.size() > size) {
    BOOST_LOG_TRIVIAL(error) << "Remote reader: Server sent " << body.size() << " bytes for a " << size << " byte range";
    throw Error(ErrorKind::PROTOCOL_VIOLATION, "response body longer than requested range");
  }
  std::memcpy(data, body.data(), body.size());

  // Less than asked for ends the stream
  bool eof = body.size() < size || response[protocol::HEADER_IS_EOF] == "true";
  return storage::IoResult{body.size(), eof};
}

std::int64_t RemoteReader::seek(std::int64_t offset, storage::Whence whence) {
  return seek_offset(offset, whence);
}


//==============================================
// REMOTE WRITER
//==============================================

RemoteWriter::RemoteWriter(std::shared_ptr<Transport> transport, const std::string& base_url,
                           const std::string& shared_secret, const std::string& id,
                           std::shared_ptr<Context> context)
  : RemoteFile(std::move(transport), base_url, shared_secret, id, std::move(context)) {
}

std::size_t RemoteWriter::write(const char* data, std::size_t size) {
  std::size_t written = write_at(data, size, offset_);
  offset_ += static_cast<std::int64_t>(written);
  return written;
}

std::size_t RemoteWriter::write_at(const char* data, std::size_t size, std::int64_t offset) {
  if (size == 0) {
    return 0;
  }
  if (offset < 0) {
    throw Error(ErrorKind::INVALID_OFFSET);
  }

  auto length = static_cast<std::int64_t>(size);
  Request request = make_request(http::verb::patch);
  request.set(protocol::HEADER_RANGE, protocol::format_range_header(offset, length));
  request.set(http::field::content_type, "application/octet-stream");
  request.body().assign(data, size);
  Response response = perform(std::move(request));

  if (response.result() != http::status::no_content) {
    throw error_from_response(response.result_int(), response.body());
  }

  protocol::ByteRange echoed;
  try {
    echoed = protocol::parse_range_header(std::string(response[protocol::HEADER_RANGE]));
  } catch (const Error& e) {
    throw Error(ErrorKind::PROTOCOL_VIOLATION, std::string("invalid range in response: ") + e.what());
  }
  if (echoed.offset != offset || echoed.length != length) {
    BOOST_LOG_TRIVIAL(error) << "Remote writer: Server acknowledged " << echoed.offset << "-" << echoed.length
                             << " for a write of " << offset << "-" << length;
    throw Error(ErrorKind::PROTOCOL_VIOLATION, "server acknowledged a different range");
  }
  return size;
}

std::int64_t RemoteWriter::seek(std::int64_t offset, storage::Whence whence) {
  return seek_offset(offset, whence);
}

void RemoteWriter::put(const std::string& data) {
  Request request = make_request(http::verb::put);
  request.set(http::field::content_type, "application/octet-stream");
  request.body() = data;
  Response response = perform(std::move(request));

  if (response.result() != http::status::no_content) {
    throw error_from_response(response.result_int(), response.body());
  }
  BOOST_LOG_TRIVIAL(debug) << "Remote writer: Put " << data.size() << " bytes to " << id();
}

} // namespace client
} // namespace netfile
