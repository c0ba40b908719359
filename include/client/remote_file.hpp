#ifndef NETFILE_CLIENT_REMOTE_FILE_HPP
#define NETFILE_CLIENT_REMOTE_FILE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include "client/transport.hpp"
#include "client/url.hpp"
#include "context/context.hpp"
#include "storage/handle.hpp"

namespace netfile {
namespace client {

// Shared state of a handle exposed by a remote file server. Holds no server
// side state besides the identifier, the offset is purely local.
class RemoteFile : public storage::Statter, public storage::Closer {
public:
  // Delete copy constructor and assignment operator
  RemoteFile(const RemoteFile&) = delete;
  RemoteFile& operator=(const RemoteFile&) = delete;


  // ---- REMOTE OPERATIONS ----
  // OPTIONS, the server decides whether the real name is disclosed
  storage::FileInfo stat() override;
  // DELETE, throws NOT_FOUND when the server already forgot the identifier
  void close() override;


  // ---- GETTERS AND SETTERS ----
  const std::string& id() const { return id_; }
  const Url& server() const { return server_; }
  std::int64_t offset() const { return offset_; }
  // Every later call is bound to this context
  void set_context(std::shared_ptr<Context> context);

protected:
  RemoteFile(std::shared_ptr<Transport> transport, const std::string& base_url,
             const std::string& shared_secret, const std::string& id, std::shared_ptr<Context> context);

  // Moves the logical offset, only SEEK END talks to the server
  std::int64_t seek_offset(std::int64_t offset, storage::Whence whence);

  Request make_request(boost::beast::http::verb method) const;
  Response perform(Request request);
  // URL for plain HTTP clients, carrying the secret as a query parameter
  std::string secret_url() const;

  // ---- PARAMETERS ----
  std::int64_t offset_ = 0;

private:
  std::shared_ptr<Transport> transport_;
  const Url server_;
  const std::string shared_secret_;
  const std::string id_;
  std::shared_ptr<Context> context_;
};


// Remote handle registered for reading
class RemoteReader : public RemoteFile, public storage::ReadSeeker, public storage::ReaderAt {
public:
  RemoteReader(std::shared_ptr<Transport> transport, const std::string& base_url,
               const std::string& shared_secret, const std::string& id,
               std::shared_ptr<Context> context = nullptr);

  // Sequential read from the logical offset
  storage::IoResult read(char* data, std::size_t size) override;
  // Ranged GETs of at most max_range bytes each until the buffer is full or
  // the stream ends, a short answer ends the stream
  storage::IoResult read_at(char* data, std::size_t size, std::int64_t offset) override;
  std::int64_t seek(std::int64_t offset, storage::Whence whence) override;

  // Plain GET URL for the whole content
  std::string get_url() const { return secret_url(); }

  // Keep below the transport's response body limit
  static constexpr std::size_t DEFAULT_MAX_RANGE = 4 * 1024 * 1024;
  void set_max_range(std::size_t max_range);
  std::size_t max_range() const { return max_range_; }

private:
  storage::IoResult fetch_range(char* data, std::size_t size, std::int64_t offset);

  std::size_t max_range_ = DEFAULT_MAX_RANGE;
};


// Remote handle registered for writing
class RemoteWriter : public RemoteFile, public storage::WriteSeeker, public storage::WriterAt {
public:
  RemoteWriter(std::shared_ptr<Transport> transport, const std::string& base_url,
               const std::string& shared_secret, const std::string& id,
               std::shared_ptr<Context> context = nullptr);

  std::size_t write(const char* data, std::size_t size) override;
  // Ranged PATCH, the echoed range must match the request exactly
  std::size_t write_at(const char* data, std::size_t size, std::int64_t offset) override;
  std::int64_t seek(std::int64_t offset, storage::Whence whence) override;

  // Full-body PUT at the server side position of the handle
  void put(const std::string& data);
  // Plain PUT URL
  std::string put_url() const { return secret_url(); }
};

} // namespace client
} // namespace netfile

#endif // NETFILE_CLIENT_REMOTE_FILE_HPP
