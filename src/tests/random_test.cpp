#include <gtest/gtest.h>
#include <set>
#include <string>
#include "error/netfile_error.hpp"
#include "utils/random.hpp"

using namespace netfile;
using namespace netfile::utils;

namespace {

bool is_base64url(const std::string& text) {
  for (char c : text) {
    bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
    if (!ok) {
      return false;
    }
  }
  return true;
}

} // namespace

TEST(RandomTest, FileIdsAreUnpaddedBase64Url) {
  std::string id = random_file_id();
  // 16 bytes encode to 22 characters without padding
  EXPECT_EQ(id.size(), 22u);
  EXPECT_TRUE(is_base64url(id)) << id;
}

TEST(RandomTest, FileIdsDoNotRepeat) {
  std::set<std::string> ids;
  for (int i = 0; i < 1000; ++i) {
    ids.insert(random_file_id());
  }
  EXPECT_EQ(ids.size(), 1000u);
}

TEST(RandomTest, SecretLengthFollowsByteCount) {
  EXPECT_EQ(random_shared_secret(32).size(), 43u);
  EXPECT_EQ(random_shared_secret(3).size(), 4u);
  EXPECT_TRUE(random_shared_secret(0).empty());
  EXPECT_NE(random_shared_secret(32), random_shared_secret(32));
}

TEST(UrlEscapeTest, EscapesReservedBytes) {
  EXPECT_EQ(url_escape("plain-name_1.txt~"), "plain-name_1.txt~");
  EXPECT_EQ(url_escape("a b/c?d"), "a%20b%2Fc%3Fd");
  EXPECT_EQ(url_escape(std::string("\xff", 1)), "%FF");
}

TEST(UrlEscapeTest, UnescapeReversesEscape) {
  const std::string text = "dir/sub dir/file%name?.bin";
  EXPECT_EQ(url_unescape(url_escape(text)), text);
  EXPECT_EQ(url_unescape("a%2fb"), "a/b");
}

TEST(UrlEscapeTest, BrokenEscapesRejected) {
  for (const std::string text : {"%", "%2", "abc%", "%zz", "%2g"}) {
    try {
      url_unescape(text);
      FAIL() << "Expected MALFORMED_REQUEST for " << text;
    } catch (const Error& e) {
      EXPECT_EQ(e.kind(), ErrorKind::MALFORMED_REQUEST);
    }
  }
}

TEST(UrlEscapeTest, FileIdFromPathIsSingleSegment) {
  std::string id = file_id_from_path("/tmp/some dir/file.txt");
  EXPECT_EQ(id.find('/'), std::string::npos);
  EXPECT_EQ(url_unescape(id), "/tmp/some dir/file.txt");
}
