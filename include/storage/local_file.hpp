#ifndef NETFILE_STORAGE_LOCAL_FILE_HPP
#define NETFILE_STORAGE_LOCAL_FILE_HPP

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include "storage/handle.hpp"

namespace netfile {
namespace storage {

enum class OpenMode {
  READ,
  WRITE,       // Creates or truncates
  READ_WRITE   // Creates if missing, keeps content
};

// A local file behind a POSIX descriptor, the usual collaborator exposed by a node
class LocalFile : public ReadSeeker, public WriteSeeker, public Statter, public Closer {
public:
  // Delete copy constructor and assignment operator
  LocalFile(const LocalFile&) = delete;
  LocalFile& operator=(const LocalFile&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  static std::unique_ptr<LocalFile> open(const std::filesystem::path& path, OpenMode mode);
  ~LocalFile() override;


  // ---- POSITIONED I/O ----
  IoResult read(char* data, std::size_t size) override;
  std::size_t write(const char* data, std::size_t size) override;
  std::int64_t seek(std::int64_t offset, Whence whence) override;


  // ---- QUERY OPERATIONS ----
  FileInfo stat() override;
  const std::filesystem::path& path() const { return path_; }
  bool is_open() const;


  // ---- TEARDOWN ----
  void close() override;

private:
  LocalFile(const std::filesystem::path& path, int fd);

  // ---- PARAMETERS ----
  std::filesystem::path path_;
  int fd_;
  // Guards fd_ against a concurrent close
  mutable std::mutex mutex_;

  // Throws CLOSED_PIPE if the descriptor was already released
  void verify_open(const char* operation) const;
};

} // namespace storage
} // namespace netfile

#endif // NETFILE_STORAGE_LOCAL_FILE_HPP
