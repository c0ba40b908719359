#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include "storage/local_file.hpp"
#include "test_utils.hpp"

using namespace netfile;
using namespace netfile::storage;

class LocalFileTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
    content = random_bytes(137);
    path = write_temp_file("local-file-", content);
  }

  void TearDown() override {
    std::filesystem::remove(path);
  }

  std::string content;
  std::filesystem::path path;
};

TEST_F(LocalFileTest, ReadsWholeFile) {
  auto file = LocalFile::open(path, OpenMode::READ);
  std::string out(200, '\0');
  std::size_t total = 0;
  for (;;) {
    IoResult result = file->read(&out[total], out.size() - total);
    total += result.bytes;
    if (result.eof) {
      break;
    }
  }
  out.resize(total);
  EXPECT_EQ(out, content);
}

TEST_F(LocalFileTest, SeekAndStat) {
  auto file = LocalFile::open(path, OpenMode::READ);
  EXPECT_EQ(file->seek(0, Whence::END), 137);
  EXPECT_EQ(file->seek(-7, Whence::CURRENT), 130);
  EXPECT_THROW(file->seek(-1, Whence::START), Error);

  FileInfo info = file->stat();
  EXPECT_EQ(info.name, path.filename().string());
  EXPECT_EQ(info.size, 137);
  EXPECT_FALSE(info.is_dir);
  EXPECT_GT(info.modtime, 0);
}

TEST_F(LocalFileTest, WriteTruncatesAndOverwrites) {
  {
    auto file = LocalFile::open(path, OpenMode::WRITE);
    EXPECT_EQ(file->write("hello world", 11), 11u);
    file->seek(6, Whence::START);
    file->write("there", 5);
  }
  EXPECT_EQ(read_whole_file(path), "hello there");
}

TEST_F(LocalFileTest, ReadWriteKeepsContent) {
  {
    auto file = LocalFile::open(path, OpenMode::READ_WRITE);
    file->write("XY", 2);
  }
  std::string expected = content;
  expected.replace(0, 2, "XY");
  EXPECT_EQ(read_whole_file(path), expected);
}

TEST_F(LocalFileTest, MissingFileIsNotFound) {
  try {
    LocalFile::open(path.string() + "-missing", OpenMode::READ);
    FAIL() << "Expected NOT_FOUND";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::NOT_FOUND);
  }
}

TEST_F(LocalFileTest, OperationsAfterCloseFail) {
  auto file = LocalFile::open(path, OpenMode::READ);
  file->close();
  EXPECT_FALSE(file->is_open());
  EXPECT_NO_THROW(file->close());

  char byte;
  try {
    file->read(&byte, 1);
    FAIL() << "Expected CLOSED_PIPE";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::CLOSED_PIPE);
  }
}
