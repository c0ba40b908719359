#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "client/http_transport.hpp"
#include "client/remote_file.hpp"
#include "protocol/headers.hpp"
#include "server/service.hpp"
#include "storage/local_file.hpp"
#include "storage/stream_adapters.hpp"
#include "utils/random.hpp"
#include "test_utils.hpp"

using namespace netfile;
using namespace netfile::client;
using ::testing::_;
using ::testing::Return;
namespace http = boost::beast::http;

namespace {

const std::string SECRET = "blurp";

class MockTransport : public Transport {
public:
  MOCK_METHOD(Response, round_trip, (const Url& server, Request request, const std::shared_ptr<Context>& context),
              (override));
};

} // namespace


class RemoteWriterTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
    server::ServerOptions options;
    options.shared_secret = SECRET;
    service = std::make_unique<server::Service>(options);
    ASSERT_TRUE(service->start());
    transport = std::make_shared<HttpTransport>();
  }

  void TearDown() override {
    service->shutdown();
    for (const auto& path : paths) {
      std::filesystem::remove(path);
    }
  }

  // Exposes an empty temp file for writing, returns its path
  std::filesystem::path serve_temp_writer(const std::string& id) {
    auto path = temp_path("writer-");
    paths.push_back(path);
    service->serve_writer(id, storage::LocalFile::open(path, storage::OpenMode::WRITE));
    return path;
  }

  RemoteWriter make_writer(const std::string& id, const std::string& secret = SECRET) {
    return RemoteWriter(transport, service->base_url(), secret, id);
  }

  std::unique_ptr<server::Service> service;
  std::shared_ptr<HttpTransport> transport;
  std::vector<std::filesystem::path> paths;
};

TEST_F(RemoteWriterTest, CopyFileThroughSmallBuffer) {
  std::string id = utils::random_file_id();
  auto dst_path = serve_temp_writer(id);

  std::string content = random_bytes(117);
  auto src_path = write_temp_file("writer-src-", content);
  paths.push_back(src_path);
  auto src = storage::LocalFile::open(src_path, storage::OpenMode::READ);

  RemoteWriter writer = make_writer(id);
  std::vector<char> buffer(17);
  EXPECT_EQ(storage::copy_buffer(writer, *src, buffer), 117u);

  // Release the server side handle so the content is on disk
  writer.close();
  EXPECT_EQ(read_whole_file(dst_path), content);
}

TEST_F(RemoteWriterTest, OverlappingSeekAndWrite) {
  auto dst_path = serve_temp_writer("f2");
  RemoteWriter writer = make_writer("f2");

  std::string first = random_bytes(11);
  std::string second = random_bytes(11);

  EXPECT_EQ(writer.seek(2, storage::Whence::START), 2);
  EXPECT_EQ(writer.write(first.data(), first.size()), 11u);
  EXPECT_EQ(writer.seek(-2, storage::Whence::CURRENT), 11);
  EXPECT_EQ(writer.write(second.data(), second.size()), 11u);
  writer.close();

  std::string expected(22, '\0');
  std::memcpy(&expected[2], first.data(), first.size());
  std::memcpy(&expected[11], second.data(), second.size());
  EXPECT_EQ(read_whole_file(dst_path), expected);
}

TEST_F(RemoteWriterTest, WriteThenReadBack) {
  auto path = temp_path("round-trip-");
  paths.push_back(path);
  auto file = storage::LocalFile::open(path, storage::OpenMode::READ_WRITE);
  service->serve_writer("rw", storage::LocalFile::open(path, storage::OpenMode::READ_WRITE));
  service->serve_reader("rw", std::move(file));

  RemoteWriter writer = make_writer("rw");
  RemoteReader reader(transport, service->base_url(), SECRET, "rw");

  const std::string data = "positioned bytes";
  writer.write_at(data.data(), data.size(), 40);

  std::string out(data.size(), '\0');
  storage::IoResult result = reader.read_at(&out[0], out.size(), 40);
  EXPECT_EQ(result.bytes, data.size());
  EXPECT_EQ(out, data);
}

TEST_F(RemoteWriterTest, PutReplacesFromCurrentPosition) {
  auto dst_path = serve_temp_writer("p");
  RemoteWriter writer = make_writer("p");

  writer.put("complete body in one request");
  writer.close();
  EXPECT_EQ(read_whole_file(dst_path), "complete body in one request");
}

TEST_F(RemoteWriterTest, PutDisabledIsUnsupported) {
  service->shutdown();
  server::ServerOptions options;
  options.shared_secret = SECRET;
  options.allow_put = false;
  service = std::make_unique<server::Service>(options);
  ASSERT_TRUE(service->start());

  serve_temp_writer("p");
  RemoteWriter writer = make_writer("p");
  try {
    writer.put("data");
    FAIL() << "Expected UNSUPPORTED_OPERATION";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::UNSUPPORTED_OPERATION);
  }
}

TEST_F(RemoteWriterTest, BadSecret) {
  serve_temp_writer("w");
  RemoteWriter writer = make_writer("w", "wrong");
  try {
    writer.write("abc", 3);
    FAIL() << "Expected UNAUTHORIZED";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::UNAUTHORIZED);
  }
  EXPECT_EQ(writer.offset(), 0);
}

TEST_F(RemoteWriterTest, WritingToReaderIsNotFound) {
  auto path = write_temp_file("reader-", "read only");
  paths.push_back(path);
  service->serve_reader("r", storage::LocalFile::open(path, storage::OpenMode::READ));

  RemoteWriter writer = make_writer("r");
  try {
    writer.write("abc", 3);
    FAIL() << "Expected NOT_FOUND";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::NOT_FOUND);
  }
}

TEST_F(RemoteWriterTest, StatReportsWrittenSize) {
  serve_temp_writer("w");
  RemoteWriter writer = make_writer("w");
  writer.write("0123456789", 10);

  EXPECT_EQ(writer.stat().size, 10);
  EXPECT_EQ(writer.seek(0, storage::Whence::END), 10);
}


TEST(RemoteWriterProtocolTest, SendsBodyAndValidatesEcho) {
  auto transport = std::make_shared<MockTransport>();
  EXPECT_CALL(*transport, round_trip(_, _, _))
    .WillOnce([](const Url&, Request request, const std::shared_ptr<Context>&) {
      EXPECT_EQ(request.method(), http::verb::patch);
      EXPECT_EQ(request[protocol::HEADER_RANGE], "7-3");
      EXPECT_EQ(request.body(), "abc");
      Response response;
      response.result(http::status::no_content);
      response.set(protocol::HEADER_RANGE, "7-3");
      return response;
    });

  RemoteWriter writer(transport, "http://server", SECRET, "id");
  EXPECT_EQ(writer.write_at("abc", 3, 7), 3u);
}

TEST(RemoteWriterProtocolTest, MismatchedEchoIsProtocolViolation) {
  auto transport = std::make_shared<MockTransport>();
  Response response;
  response.result(http::status::no_content);
  response.set(protocol::HEADER_RANGE, "0-2");
  EXPECT_CALL(*transport, round_trip(_, _, _)).WillOnce(Return(response));

  RemoteWriter writer(transport, "http://server", SECRET, "id");
  try {
    writer.write("abc", 3);
    FAIL() << "Expected PROTOCOL_VIOLATION";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::PROTOCOL_VIOLATION);
  }
  EXPECT_EQ(writer.offset(), 0);
}

TEST(RemoteWriterProtocolTest, MissingEchoIsProtocolViolation) {
  auto transport = std::make_shared<MockTransport>();
  Response response;
  response.result(http::status::no_content);
  EXPECT_CALL(*transport, round_trip(_, _, _)).WillOnce(Return(response));

  RemoteWriter writer(transport, "http://server", SECRET, "id");
  EXPECT_THROW(writer.write("abc", 3), Error);
}

TEST(RemoteWriterProtocolTest, ZeroLengthWriteStaysLocal) {
  auto transport = std::make_shared<MockTransport>();
  EXPECT_CALL(*transport, round_trip(_, _, _)).Times(0);

  RemoteWriter writer(transport, "http://server", SECRET, "id");
  EXPECT_EQ(writer.write("", 0), 0u);
  EXPECT_EQ(writer.seek(5, storage::Whence::START), 5);
}
