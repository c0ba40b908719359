#include "storage/local_file.hpp"
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include "error/netfile_error.hpp"

namespace netfile {
namespace storage {

namespace {

Error io_error(const std::string& operation, const std::filesystem::path& path, int error_number) {
  return Error(ErrorKind::IO_ERROR,
               operation + " " + path.string() + ": " + std::strerror(error_number));
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

LocalFile::LocalFile(const std::filesystem::path& path, int fd)
  : path_(path)
  , fd_(fd) {
}

std::unique_ptr<LocalFile> LocalFile::open(const std::filesystem::path& path, OpenMode mode) {
  int flags = O_CLOEXEC;
  switch (mode) {
    case OpenMode::READ:
      flags |= O_RDONLY;
      break;
    case OpenMode::WRITE:
      flags |= O_WRONLY | O_CREAT | O_TRUNC;
      break;
    case OpenMode::READ_WRITE:
      flags |= O_RDWR | O_CREAT;
      break;
  }

  int fd = ::open(path.c_str(), flags, 0644);
  if (fd < 0) {
    int error_number = errno;
    BOOST_LOG_TRIVIAL(error) << "Local file: Failed to open " << path.string() << ": " << std::strerror(error_number);
    if (error_number == ENOENT) {
      throw Error(ErrorKind::NOT_FOUND, "open " + path.string() + ": no such file or directory");
    }
    throw io_error("open", path, error_number);
  }

  BOOST_LOG_TRIVIAL(debug) << "Local file: Opened " << path.string() << " with descriptor " << fd;
  return std::unique_ptr<LocalFile>(new LocalFile(path, fd));
}

LocalFile::~LocalFile() {
  try {
    close();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Local file: Error closing " << path_.string() << " in destructor: " << e.what();
  }
}


//==============================================
// POSITIONED I/O
//==============================================

IoResult LocalFile::read(char* data, std::size_t size) {
  std::lock_guard<std::mutex> lock(mutex_);
  verify_open("read");

  IoResult result;
  if (size == 0) {
    return result;
  }

  ssize_t n;
  do {
    n = ::read(fd_, data, size);
  } while (n < 0 && errno == EINTR);

  if (n < 0) {
    throw io_error("read", path_, errno);
  }

  result.bytes = static_cast<std::size_t>(n);
  result.eof = (n == 0);
  return result;
}

std::size_t LocalFile::write(const char* data, std::size_t size) {
  std::lock_guard<std::mutex> lock(mutex_);
  verify_open("write");

  std::size_t written = 0;
  while (written < size) {
    ssize_t n = ::write(fd_, data + written, size - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw io_error("write", path_, errno);
    }
    if (n == 0) {
      throw Error(ErrorKind::SHORT_WRITE);
    }
    written += static_cast<std::size_t>(n);
  }
  return written;
}

std::int64_t LocalFile::seek(std::int64_t offset, Whence whence) {
  std::lock_guard<std::mutex> lock(mutex_);
  verify_open("seek");

  int native_whence = SEEK_SET;
  switch (whence) {
    case Whence::START: native_whence = SEEK_SET; break;
    case Whence::CURRENT: native_whence = SEEK_CUR; break;
    case Whence::END: native_whence = SEEK_END; break;
  }

  off_t position = ::lseek(fd_, static_cast<off_t>(offset), native_whence);
  if (position < 0) {
    if (errno == EINVAL) {
      throw Error(ErrorKind::INVALID_OFFSET, "seek " + path_.string() + ": invalid argument");
    }
    throw io_error("seek", path_, errno);
  }
  return static_cast<std::int64_t>(position);
}


//==============================================
// QUERY OPERATIONS
//==============================================

FileInfo LocalFile::stat() {
  std::lock_guard<std::mutex> lock(mutex_);
  verify_open("stat");

  struct stat st;
  if (::fstat(fd_, &st) != 0) {
    throw io_error("stat", path_, errno);
  }

  FileInfo info;
  info.name = path_.filename().string();
  info.size = static_cast<std::int64_t>(st.st_size);
  info.modtime = static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
  info.is_dir = S_ISDIR(st.st_mode);
  info.mode = static_cast<std::uint32_t>(st.st_mode & 07777);
  if (info.is_dir) {
    info.mode |= MODE_DIR;
  }
  return info;
}

bool LocalFile::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fd_ >= 0;
}


//==============================================
// TEARDOWN
//==============================================

void LocalFile::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ < 0) {
    return;
  }

  int fd = fd_;
  fd_ = -1;
  if (::close(fd) != 0) {
    throw io_error("close", path_, errno);
  }
  BOOST_LOG_TRIVIAL(debug) << "Local file: Closed " << path_.string();
}

void LocalFile::verify_open(const char* operation) const {
  if (fd_ < 0) {
    throw Error(ErrorKind::CLOSED_PIPE, std::string(operation) + " " + path_.string() + ": file already closed");
  }
}

} // namespace storage
} // namespace netfile
