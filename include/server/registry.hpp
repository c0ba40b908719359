#ifndef NETFILE_SERVER_REGISTRY_HPP
#define NETFILE_SERVER_REGISTRY_HPP

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>
#include "context/context.hpp"
#include "mux/multiplexer.hpp"
#include "storage/handle.hpp"

namespace netfile {
namespace server {

enum class HandleKind {
  READER,
  WRITER
};

const char* handle_kind_to_string(HandleKind kind);

// Result of a lookup over both kinds, at most one of the two is set
struct ExposedHandle {
  std::shared_ptr<mux::ReadMultiplexer> reader;
  std::shared_ptr<mux::WriteMultiplexer> writer;

  explicit operator bool() const { return reader || writer; }
};

// Identifier to exposed handle bookkeeping. Readers and writers live in
// independent maps so one identifier may carry one of each.
class Registry {
public:
  // Delete copy constructor and assignment operator
  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Registry() = default;
  ~Registry();


  // ---- REGISTRATION ----
  // Seeks the handle to the start and takes ownership of it. When context is
  // given, the handle is closed and removed as soon as the context is done.
  // Throws ALREADY_REGISTERED if the identifier already has a reader.
  void register_reader(const std::string& id, std::unique_ptr<storage::ReadSeeker> handle,
                       std::shared_ptr<Context> context = nullptr);
  void register_writer(const std::string& id, std::unique_ptr<storage::WriteSeeker> handle,
                       std::shared_ptr<Context> context = nullptr);


  // ---- LOOKUP ----
  // nullptr when absent
  std::shared_ptr<mux::ReadMultiplexer> find_reader(const std::string& id) const;
  std::shared_ptr<mux::WriteMultiplexer> find_writer(const std::string& id) const;
  // Reader preferred over writer
  ExposedHandle find_any(const std::string& id) const;


  // ---- CLOSING ----
  // Removes whatever is registered under id, returns the number of kinds removed
  std::size_t close(const std::string& id);
  bool close_reader(const std::string& id);
  bool close_writer(const std::string& id);
  // Whether removed handles also get their own close() called
  void set_close_handles(bool readers, bool writers);


  // ---- UTILITY METHODS ----
  // Sorted, each identifier once
  std::vector<std::string> ids() const;
  // Number of registered handles over both kinds
  std::size_t size() const;
  // Closes every remaining handle and joins all waiters
  void shutdown();

private:
  template <typename Mux>
  struct Entry {
    std::shared_ptr<Mux> mux;
    // Cancelled when the entry goes away, releases the waiter
    std::shared_ptr<Context> watch;
  };

  using ReaderEntry = Entry<mux::ReadMultiplexer>;
  using WriterEntry = Entry<mux::WriteMultiplexer>;

  struct Waiter {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  template <typename Handle>
  void register_handle(std::map<std::string, Entry<mux::Multiplexer<Handle>>>& entries,
                       HandleKind kind, const std::string& id, std::unique_ptr<Handle> handle,
                       std::shared_ptr<Context> context);

  template <typename Mux>
  bool remove_entry(std::map<std::string, Entry<Mux>>& entries, HandleKind kind,
                    const std::string& id, const Context* expected_watch);

  template <typename Mux>
  void release_entry(HandleKind kind, const std::string& id, Entry<Mux>& entry);

  void start_waiter(HandleKind kind, const std::string& id, std::shared_ptr<Context> watch);
  void reap_waiters();

  // ---- PARAMETERS ----
  std::map<std::string, ReaderEntry> readers_;
  std::map<std::string, WriterEntry> writers_;
  mutable std::shared_mutex mutex_;

  std::atomic<bool> close_readers_{true};
  std::atomic<bool> close_writers_{true};

  std::vector<Waiter> waiters_;
  std::mutex waiters_mutex_;
};

} // namespace server
} // namespace netfile

#endif // NETFILE_SERVER_REGISTRY_HPP
