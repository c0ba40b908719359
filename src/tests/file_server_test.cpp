#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "client/http_transport.hpp"
#include "error/status_codes.hpp"
#include "protocol/headers.hpp"
#include "server/file_server.hpp"
#include "server/service.hpp"
#include "test_utils.hpp"

using namespace netfile;
using namespace netfile::server;
namespace http = boost::beast::http;

namespace {

const std::string SECRET = "blurp";

// Handler side of one request, captured in memory
class FakeExchange : public HttpExchange {
public:
  FakeExchange(http::verb method, const std::string& target, std::string body = "",
               const std::string& secret = "")
    : body_(std::move(body)) {
    request_.method(method);
    request_.target(target);
    request_.version(11);
    if (!secret.empty()) {
      request_.set(protocol::HEADER_SHARED_SECRET, secret);
    }
  }

  RequestHeader& header() { return request_; }

  const RequestHeader& request() const override { return request_; }
  storage::Reader& body() override { return body_; }

  void send(Response&& response) override {
    ++sends;
    started_ = true;
    status = response.result_int();
    headers = response.base();
    response_body = response.body();
  }

  void send_stream(ResponseHeader&& header, storage::Reader& source, std::uint64_t length) override {
    ++sends;
    started_ = true;
    status = header.result_int();
    headers = header;

    std::vector<char> chunk(7);
    while (response_body.size() < length) {
      auto want = std::min<std::uint64_t>(chunk.size(), length - response_body.size());
      storage::IoResult result = source.read(chunk.data(), static_cast<std::size_t>(want));
      response_body.append(chunk.data(), result.bytes);
      if (result.bytes == 0 && result.eof) {
        break;
      }
    }
  }

  bool response_started() const override { return started_; }

  std::string header_value(const std::string& name) const {
    return std::string(headers[name]);
  }

  int sends = 0;
  unsigned status = 0;
  ResponseHeader headers;
  std::string response_body;

private:
  RequestHeader request_;
  MemoryFile body_;
  bool started_ = false;
};

} // namespace


class FileServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
    options.shared_secret = SECRET;
  }

  FileServer& server() {
    if (!file_server) {
      file_server = std::make_unique<FileServer>(registry, options);
    }
    return *file_server;
  }

  MemoryFile* serve_reader(const std::string& id, const std::string& content, const std::string& name = "data.bin") {
    auto handle = std::make_unique<MemoryFile>(content, name);
    MemoryFile* file = handle.get();
    registry.register_reader(id, std::move(handle));
    return file;
  }

  MemoryFile* serve_writer(const std::string& id, const std::string& content = "") {
    auto handle = std::make_unique<MemoryFile>(content, "upload.bin");
    MemoryFile* file = handle.get();
    registry.register_writer(id, std::move(handle));
    return file;
  }

  FakeExchange request(http::verb method, const std::string& target, const std::string& body = "",
                       const std::string& secret = SECRET) {
    return FakeExchange(method, target, body, secret);
  }

  void run(FakeExchange& exchange) {
    server().handle(exchange);
    ASSERT_EQ(exchange.sends, 1);
  }

  ServerOptions options;
  Registry registry;
  std::unique_ptr<FileServer> file_server;
};

TEST_F(FileServerTest, RejectsEmptySecret) {
  options.shared_secret.clear();
  EXPECT_THROW(FileServer(registry, options), std::invalid_argument);
}

TEST_F(FileServerTest, WrongSecretIsUnauthorizedWithoutTouchingHandle) {
  MemoryFile* file = serve_reader("f", "0123456789");
  int seeks = file->seeks;

  auto exchange = request(http::verb::get, "/f", "", "wrong");
  exchange.header().set(protocol::HEADER_RANGE, "0-4");
  run(exchange);

  EXPECT_EQ(exchange.status, 401u);
  EXPECT_EQ(file->reads, 0);
  EXPECT_EQ(file->seeks, seeks);
}

TEST_F(FileServerTest, WrongSecretOnEveryVerb) {
  MemoryFile* reader = serve_reader("f", "0123456789");
  MemoryFile* writer = serve_writer("f", "0123456789");
  int reader_seeks = reader->seeks;
  int writer_seeks = writer->seeks;

  for (auto method : {http::verb::options, http::verb::get, http::verb::patch, http::verb::put,
                      http::verb::delete_, http::verb::post}) {
    auto exchange = request(method, "/f", "abc", "wrong");
    exchange.header().set(protocol::HEADER_RANGE, "0-3");
    run(exchange);
    EXPECT_EQ(exchange.status, 401u) << http::to_string(method);
  }

  EXPECT_EQ(reader->reads, 0);
  EXPECT_EQ(writer->writes, 0);
  EXPECT_EQ(reader->seeks, reader_seeks);
  EXPECT_EQ(writer->seeks, writer_seeks);
  EXPECT_EQ(reader->closes, 0);
  EXPECT_EQ(registry.size(), 2u);
}

TEST_F(FileServerTest, MissingSecretIsUnauthorized) {
  serve_reader("f", "0123456789");
  auto exchange = request(http::verb::options, "/f", "", "");
  run(exchange);
  EXPECT_EQ(exchange.status, 401u);
}

TEST_F(FileServerTest, SecretAcceptedAsQueryParameter) {
  serve_reader("f", "0123456789");
  auto exchange = request(http::verb::get, "/f?shared-secret=" + SECRET, "", "");
  run(exchange);
  EXPECT_EQ(exchange.status, 200u);
  EXPECT_EQ(exchange.response_body, "0123456789");
}

TEST_F(FileServerTest, PrefixMismatchIsBadRequest) {
  options.url_prefix = "/files";
  serve_reader("f", "0123456789");

  auto wrong = request(http::verb::get, "/other/f");
  run(wrong);
  EXPECT_EQ(wrong.status, 400u);

  auto right = request(http::verb::get, "/files/f");
  run(right);
  EXPECT_EQ(right.status, 200u);
}

TEST_F(FileServerTest, PrefixCheckedBeforeSecret) {
  options.url_prefix = "/files";
  auto exchange = request(http::verb::get, "/other/f", "", "wrong");
  run(exchange);
  EXPECT_EQ(exchange.status, 400u);
}

TEST_F(FileServerTest, PathMustBeSingleSegment) {
  for (const std::string target : {"/", "/a/b", "//a"}) {
    auto exchange = request(http::verb::get, target);
    run(exchange);
    EXPECT_EQ(exchange.status, 400u) << target;
  }
}

TEST_F(FileServerTest, PercentEncodedIdentifierIsDecoded) {
  serve_reader("my file", "abc");
  auto exchange = request(http::verb::get, "/my%20file");
  run(exchange);
  EXPECT_EQ(exchange.status, 200u);
  EXPECT_EQ(exchange.response_body, "abc");
}

TEST_F(FileServerTest, UnsupportedMethod) {
  serve_reader("f", "abc");
  auto exchange = request(http::verb::post, "/f");
  run(exchange);
  EXPECT_EQ(exchange.status, 405u);
}

TEST_F(FileServerTest, UnknownIdentifierIsNotFound) {
  for (auto method : {http::verb::get, http::verb::options, http::verb::put, http::verb::delete_}) {
    auto exchange = request(method, "/missing");
    run(exchange);
    EXPECT_EQ(exchange.status, 404u) << http::to_string(method);
  }

  auto patch = request(http::verb::patch, "/missing", "abc");
  patch.header().set(protocol::HEADER_RANGE, "0-3");
  run(patch);
  EXPECT_EQ(patch.status, 404u);
}

TEST_F(FileServerTest, RangedRead) {
  serve_reader("f", "0123456789");
  auto exchange = request(http::verb::get, "/f");
  exchange.header().set(protocol::HEADER_RANGE, "2-5");
  run(exchange);

  EXPECT_EQ(exchange.status, 206u);
  EXPECT_EQ(exchange.response_body, "23456");
  EXPECT_EQ(exchange.header_value(protocol::HEADER_RANGE), "2-5");
  EXPECT_EQ(exchange.header_value(protocol::HEADER_IS_EOF), "false");
}

TEST_F(FileServerTest, RangedReadAcrossEndIsShort) {
  serve_reader("f", "0123456789");
  auto exchange = request(http::verb::get, "/f");
  exchange.header().set(protocol::HEADER_RANGE, "8-10");
  run(exchange);

  EXPECT_EQ(exchange.status, 206u);
  EXPECT_EQ(exchange.response_body, "89");
  EXPECT_EQ(exchange.header_value(protocol::HEADER_RANGE), "8-2");
  EXPECT_EQ(exchange.header_value(protocol::HEADER_IS_EOF), "true");
}

TEST_F(FileServerTest, RangedReadPastEndIsEmpty) {
  serve_reader("f", "0123456789");
  auto exchange = request(http::verb::get, "/f");
  exchange.header().set(protocol::HEADER_RANGE, "10-4");
  run(exchange);

  EXPECT_EQ(exchange.status, 206u);
  EXPECT_TRUE(exchange.response_body.empty());
  EXPECT_EQ(exchange.header_value(protocol::HEADER_IS_EOF), "true");
}

TEST_F(FileServerTest, InvalidRangeHeaders) {
  serve_reader("f", "0123456789");
  const std::vector<std::pair<std::string, std::string>> cases = {
    {"abc", "error parsing range header"},
    {"1-", "error parsing range header"},
    {"1-2-3", "error parsing range header"},
    {"-1-5", "invalid offset"},
    {"0-0", "invalid buffer length"},
    {"0--3", "invalid buffer length"},
  };

  for (const auto& c : cases) {
    auto exchange = request(http::verb::get, "/f");
    exchange.header().set(protocol::HEADER_RANGE, c.first);
    run(exchange);
    EXPECT_EQ(exchange.status, 400u) << c.first;
    EXPECT_EQ(exchange.response_body, c.second) << c.first;
  }
}

TEST_F(FileServerTest, UnknownIdentifierWinsOverBadRange) {
  auto exchange = request(http::verb::get, "/missing");
  exchange.header().set(protocol::HEADER_RANGE, "abc");
  run(exchange);
  EXPECT_EQ(exchange.status, 404u);
}

TEST_F(FileServerTest, StorageFailureMapsToStatus) {
  MemoryFile* file = serve_reader("f", "0123456789");
  file->close();

  auto exchange = request(http::verb::get, "/f");
  exchange.header().set(protocol::HEADER_RANGE, "0-4");
  run(exchange);
  EXPECT_EQ(exchange.status, HTTP_CODE_CLOSED_PIPE);
}

TEST_F(FileServerTest, FullRead) {
  serve_reader("f", "0123456789");
  auto exchange = request(http::verb::get, "/f");
  run(exchange);

  EXPECT_EQ(exchange.status, 200u);
  EXPECT_EQ(exchange.response_body, "0123456789");
  EXPECT_EQ(exchange.header_value("Accept-Ranges"), "bytes");
}

TEST_F(FileServerTest, FullReadDisabledRequiresRange) {
  options.allow_full_get = false;
  serve_reader("f", "0123456789");
  auto exchange = request(http::verb::get, "/f");
  run(exchange);

  EXPECT_EQ(exchange.status, 400u);
  EXPECT_EQ(exchange.response_body, "error parsing range header");
}

TEST_F(FileServerTest, StandardRangeRequests) {
  serve_reader("f", "0123456789");

  auto middle = request(http::verb::get, "/f");
  middle.header().set(http::field::range, "bytes=2-4");
  run(middle);
  EXPECT_EQ(middle.status, 206u);
  EXPECT_EQ(middle.response_body, "234");
  EXPECT_EQ(middle.header_value("Content-Range"), "bytes 2-4/10");

  auto suffix = request(http::verb::get, "/f");
  suffix.header().set(http::field::range, "bytes=-3");
  run(suffix);
  EXPECT_EQ(suffix.status, 206u);
  EXPECT_EQ(suffix.response_body, "789");

  auto open_ended = request(http::verb::get, "/f");
  open_ended.header().set(http::field::range, "bytes=6-");
  run(open_ended);
  EXPECT_EQ(open_ended.response_body, "6789");

  auto unsatisfiable = request(http::verb::get, "/f");
  unsatisfiable.header().set(http::field::range, "bytes=20-");
  run(unsatisfiable);
  EXPECT_EQ(unsatisfiable.status, 416u);
  EXPECT_EQ(unsatisfiable.header_value("Content-Range"), "bytes */10");

  auto other_unit = request(http::verb::get, "/f");
  other_unit.header().set(http::field::range, "items=1-2");
  run(other_unit);
  EXPECT_EQ(other_unit.status, 200u);
  EXPECT_EQ(other_unit.response_body, "0123456789");
}

TEST(ContentRangeTest, ParsesForms) {
  auto range = parse_content_range("bytes=0-0", 10);
  ASSERT_TRUE(range);
  EXPECT_EQ(range->first, 0u);
  EXPECT_EQ(range->length, 1u);

  range = parse_content_range("bytes=5-100", 10);
  ASSERT_TRUE(range);
  EXPECT_EQ(range->length, 5u);

  range = parse_content_range("bytes=-100", 10);
  ASSERT_TRUE(range);
  EXPECT_EQ(range->first, 0u);
  EXPECT_EQ(range->length, 10u);

  EXPECT_FALSE(parse_content_range("bytes=0-1,3-4", 10));
  EXPECT_FALSE(parse_content_range("bytes=4-2", 10));
  EXPECT_THROW(parse_content_range("bytes=10-", 10), Error);
  EXPECT_THROW(parse_content_range("bytes=-0", 10), Error);
}

TEST_F(FileServerTest, PatchWritesDeclaredRange) {
  MemoryFile* file = serve_writer("w", "..........");
  auto exchange = request(http::verb::patch, "/w", "abcd");
  exchange.header().set(protocol::HEADER_RANGE, "3-4");
  run(exchange);

  EXPECT_EQ(exchange.status, 204u);
  EXPECT_EQ(exchange.header_value(protocol::HEADER_RANGE), "3-4");
  EXPECT_EQ(file->content(), "...abcd...");
}

TEST_F(FileServerTest, PatchBodyLengthMismatch) {
  MemoryFile* file = serve_writer("w", "..........");

  auto shorter = request(http::verb::patch, "/w", "abc");
  shorter.header().set(protocol::HEADER_RANGE, "0-4");
  run(shorter);
  EXPECT_EQ(shorter.status, 400u);
  EXPECT_EQ(shorter.response_body, "invalid body length");

  auto longer = request(http::verb::patch, "/w", "abcdef");
  longer.header().set(protocol::HEADER_RANGE, "0-4");
  run(longer);
  EXPECT_EQ(longer.status, 400u);
  EXPECT_EQ(longer.response_body, "invalid body length");

  // Nothing past the declared length reaches the handle
  EXPECT_EQ(file->content().substr(4), "......");
}

TEST_F(FileServerTest, PatchBadRangeBeforeLookup) {
  auto exchange = request(http::verb::patch, "/missing", "abc");
  exchange.header().set(protocol::HEADER_RANGE, "x");
  run(exchange);
  EXPECT_EQ(exchange.status, 400u);
}

TEST_F(FileServerTest, PatchOnReaderIsNotFound) {
  serve_reader("f", "0123456789");
  auto exchange = request(http::verb::patch, "/f", "abc");
  exchange.header().set(protocol::HEADER_RANGE, "0-3");
  run(exchange);
  EXPECT_EQ(exchange.status, 404u);
}

TEST_F(FileServerTest, PutWritesWholeBody) {
  MemoryFile* file = serve_writer("w");
  auto exchange = request(http::verb::put, "/w", "the whole content");
  run(exchange);

  EXPECT_EQ(exchange.status, 204u);
  EXPECT_EQ(file->content(), "the whole content");
}

TEST_F(FileServerTest, PutDisabledIsForbidden) {
  options.allow_put = false;
  MemoryFile* file = serve_writer("w");
  auto exchange = request(http::verb::put, "/w", "data");
  run(exchange);

  EXPECT_EQ(exchange.status, 403u);
  EXPECT_EQ(file->writes, 0);
}

TEST_F(FileServerTest, DeleteClosesOnce) {
  auto handle = std::make_unique<MemoryFile>("abc");
  MemoryFile* file = handle.get();
  registry.register_reader("f", std::move(handle));
  auto held = registry.find_reader("f");

  auto first = request(http::verb::delete_, "/f");
  run(first);
  EXPECT_EQ(first.status, 204u);
  EXPECT_EQ(file->closes, 1);

  auto second = request(http::verb::delete_, "/f");
  run(second);
  EXPECT_EQ(second.status, 404u);
}

TEST_F(FileServerTest, DeleteDisabledIsForbidden) {
  options.allow_close = false;
  serve_reader("f", "abc");
  auto exchange = request(http::verb::delete_, "/f");
  run(exchange);

  EXPECT_EQ(exchange.status, 403u);
  EXPECT_NE(registry.find_reader("f"), nullptr);
}

TEST_F(FileServerTest, StatDisclosesName) {
  serve_reader("f", "0123456789", "report.pdf");
  auto exchange = request(http::verb::options, "/f");
  run(exchange);

  EXPECT_EQ(exchange.status, 200u);
  EXPECT_EQ(exchange.header_value(protocol::HEADER_CONTENT_LENGTH), "10");
  storage::FileInfo info = storage::decode_file_info(exchange.response_body);
  EXPECT_EQ(info.name, "report.pdf");
  EXPECT_EQ(info.size, 10);
}

TEST_F(FileServerTest, StatHidesNameWhenNotDisclosed) {
  options.disclose_filenames = false;
  serve_reader("f", "0123456789", "report.pdf");
  auto exchange = request(http::verb::options, "/f");
  run(exchange);

  storage::FileInfo info = storage::decode_file_info(exchange.response_body);
  EXPECT_EQ(info.name, "f");
}

TEST_F(FileServerTest, StatOnWriter) {
  serve_writer("w", "1234");
  auto exchange = request(http::verb::options, "/w");
  run(exchange);
  EXPECT_EQ(exchange.status, 200u);
  EXPECT_EQ(storage::decode_file_info(exchange.response_body).size, 4);
}

TEST_F(FileServerTest, StatUnsupported) {
  registry.register_reader("plain", std::make_unique<PlainReader>("abc"));
  auto plain = request(http::verb::options, "/plain");
  run(plain);
  EXPECT_EQ(plain.status, HTTP_CODE_UNSUPPORTED_OPERATION);

  options.allow_stat = false;
  file_server.reset();
  serve_reader("f", "abc");
  auto disabled = request(http::verb::options, "/f");
  run(disabled);
  EXPECT_EQ(disabled.status, HTTP_CODE_UNSUPPORTED_OPERATION);
}


// Same handler behind the real listener
class FileServiceTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
    ServerOptions options;
    options.shared_secret = SECRET;
    options.max_body_size = 64;
    service = std::make_unique<Service>(options);
    ASSERT_TRUE(service->start());
    url = client::Url::parse(service->base_url());
  }

  void TearDown() override {
    service->shutdown();
  }

  client::Request make_request(http::verb method, const std::string& id) {
    client::Request request{method, url.target_for(id), 11};
    request.set(protocol::HEADER_SHARED_SECRET, SECRET);
    return request;
  }

  std::unique_ptr<Service> service;
  client::Url url;
};

TEST_F(FileServiceTest, ConcurrentFullReads) {
  const std::string content = random_bytes(113025);
  service->serve_reader("big", std::make_unique<MemoryFile>(content));

  client::HttpTransport transport;
  std::atomic<int> matches{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 100; ++i) {
    threads.emplace_back([&]() {
      try {
        client::Response response = transport.round_trip(url, make_request(http::verb::get, "big"), nullptr);
        if (response.result() == http::status::ok && response.body() == content) {
          ++matches;
        }
      } catch (const std::exception& e) {
        ADD_FAILURE() << e.what();
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(matches, 100);
}

TEST_F(FileServiceTest, KeepAliveConnectionIsReused) {
  service->serve_reader("f", std::make_unique<MemoryFile>("0123456789"));
  client::HttpTransport transport;

  for (int i = 0; i < 5; ++i) {
    auto request = make_request(http::verb::get, "f");
    request.set(protocol::HEADER_RANGE, std::to_string(i) + "-2");
    client::Response response = transport.round_trip(url, std::move(request), nullptr);
    EXPECT_EQ(response.result_int(), 206u);
  }
  EXPECT_EQ(transport.idle_connections(), 1u);
}

TEST_F(FileServiceTest, OversizedBodyRejected) {
  service->serve_writer("w", std::make_unique<MemoryFile>());
  client::HttpTransport transport;

  auto request = make_request(http::verb::put, "w");
  request.body() = std::string(200, 'x');
  client::Response response = transport.round_trip(url, std::move(request), nullptr);

  EXPECT_EQ(response.result_int(), 400u);
  EXPECT_EQ(response.body(), "request body too large");
}

TEST_F(FileServiceTest, ErrorStatusOverTheWire) {
  client::HttpTransport transport;
  client::Response response = transport.round_trip(url, make_request(http::verb::get, "missing"), nullptr);
  EXPECT_EQ(response.result_int(), 404u);

  auto request = make_request(http::verb::get, "missing");
  request.set(protocol::HEADER_SHARED_SECRET, "wrong");
  response = transport.round_trip(url, std::move(request), nullptr);
  EXPECT_EQ(response.result_int(), 401u);
}
