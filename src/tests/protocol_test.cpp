#include <gtest/gtest.h>
#include <string>
#include "client/url.hpp"
#include "error/netfile_error.hpp"
#include "protocol/headers.hpp"
#include "storage/file_info.hpp"

using namespace netfile;

TEST(RangeHeaderTest, ParsesOffsetAndLength) {
  protocol::ByteRange range = protocol::parse_range_header("120-13");
  EXPECT_EQ(range.offset, 120);
  EXPECT_EQ(range.length, 13);

  range = protocol::parse_range_header("  0-1 ");
  EXPECT_EQ(range.offset, 0);
  EXPECT_EQ(range.length, 1);
}

TEST(RangeHeaderTest, FormatsRoundTrip) {
  EXPECT_EQ(protocol::format_range_header(130, 7), "130-7");
  protocol::ByteRange range = protocol::parse_range_header(protocol::format_range_header(9000000000LL, 4));
  EXPECT_EQ(range.offset, 9000000000LL);
}

TEST(RangeHeaderTest, RejectsMalformedValues) {
  for (const std::string value : {"", "12", "a-1", "1-b", "1 -2", "99999999999999999999-1"}) {
    try {
      protocol::parse_range_header(value);
      FAIL() << "Expected failure for '" << value << "'";
    } catch (const Error& e) {
      EXPECT_EQ(e.kind(), ErrorKind::MALFORMED_REQUEST);
      EXPECT_STREQ(e.what(), "error parsing range header") << value;
    }
  }
}

TEST(RangeHeaderTest, RejectsNegativeOffsetAndEmptyLength) {
  try {
    protocol::parse_range_header("-5-10");
    FAIL();
  } catch (const Error& e) {
    EXPECT_STREQ(e.what(), "invalid offset");
  }

  try {
    protocol::parse_range_header("5-0");
    FAIL();
  } catch (const Error& e) {
    EXPECT_STREQ(e.what(), "invalid buffer length");
  }
}

TEST(UrlTest, ParsesHostPortAndPrefix) {
  client::Url url = client::Url::parse("http://127.0.0.1:3001/files/");
  EXPECT_EQ(url.host, "127.0.0.1");
  EXPECT_EQ(url.port, 3001);
  EXPECT_EQ(url.prefix, "/files");
  EXPECT_EQ(url.authority(), "127.0.0.1:3001");
  EXPECT_EQ(url.to_string(), "http://127.0.0.1:3001/files");
  EXPECT_EQ(url.target_for("a b"), "/files/a%20b");
}

TEST(UrlTest, DefaultsAndIpv6) {
  client::Url plain = client::Url::parse("http://server");
  EXPECT_EQ(plain.port, 80);
  EXPECT_EQ(plain.prefix, "");
  EXPECT_EQ(plain.target_for("id"), "/id");

  client::Url v6 = client::Url::parse("http://[::1]:8080");
  EXPECT_EQ(v6.host, "::1");
  EXPECT_EQ(v6.port, 8080);
  EXPECT_EQ(v6.authority(), "[::1]:8080");
}

TEST(UrlTest, RejectsUnsupportedUrls) {
  for (const std::string text : {"https://server", "server:80", "http://", "http://host:99999", "http://host:8x",
                                 "http://[::1"}) {
    EXPECT_THROW(client::Url::parse(text), Error) << text;
  }
}

TEST(FileInfoTest, EncodesAndDecodes) {
  storage::FileInfo info;
  info.name = "report.pdf";
  info.size = 4096;
  info.modtime = 1700000000123456789LL;
  info.mode = 0644;

  storage::FileInfo decoded = storage::decode_file_info(storage::encode_file_info(info));
  EXPECT_EQ(decoded.name, info.name);
  EXPECT_EQ(decoded.size, info.size);
  EXPECT_EQ(decoded.modtime, info.modtime);
  EXPECT_EQ(decoded.mode, info.mode);
  EXPECT_FALSE(decoded.is_dir);
}

TEST(FileInfoTest, RejectsGarbage) {
  try {
    storage::decode_file_info("not json");
    FAIL();
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::PROTOCOL_VIOLATION);
  }
}
