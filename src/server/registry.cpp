#include "server/registry.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "error/netfile_error.hpp"

namespace netfile {
namespace server {

const char* handle_kind_to_string(HandleKind kind) {
  switch (kind) {
    case HandleKind::READER: return "reader";
    case HandleKind::WRITER: return "writer";
    default: return "unknown";
  }
}

Registry::~Registry() {
  shutdown();
}


//==============================================
// REGISTRATION
//==============================================

void Registry::register_reader(const std::string& id, std::unique_ptr<storage::ReadSeeker> handle,
                               std::shared_ptr<Context> context) {
  register_handle(readers_, HandleKind::READER, id, std::move(handle), std::move(context));
}

void Registry::register_writer(const std::string& id, std::unique_ptr<storage::WriteSeeker> handle,
                               std::shared_ptr<Context> context) {
  register_handle(writers_, HandleKind::WRITER, id, std::move(handle), std::move(context));
}

template <typename Handle>
void Registry::register_handle(std::map<std::string, Entry<mux::Multiplexer<Handle>>>& entries,
                               HandleKind kind, const std::string& id, std::unique_ptr<Handle> handle,
                               std::shared_ptr<Context> context) {
  if (!handle) {
    throw std::invalid_argument("Registry: Null handle");
  }

  reap_waiters();

  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (entries.find(id) != entries.end()) {
      BOOST_LOG_TRIVIAL(warning) << "Registry: Identifier " << id << " already has a " << handle_kind_to_string(kind);
      throw Error(ErrorKind::ALREADY_REGISTERED);
    }
  }

  // Normalize the starting position before the handle becomes visible
  handle->seek(0, storage::Whence::START);

  Entry<mux::Multiplexer<Handle>> entry;
  entry.mux = std::make_shared<mux::Multiplexer<Handle>>(std::move(handle));
  if (context) {
    entry.watch = Context::with_cancel(context);
  }

  {
    // Another registration may have won the race since the check above
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (entries.find(id) != entries.end()) {
      BOOST_LOG_TRIVIAL(warning) << "Registry: Identifier " << id << " already has a " << handle_kind_to_string(kind);
      throw Error(ErrorKind::ALREADY_REGISTERED);
    }
    entries.emplace(id, entry);
  }

  BOOST_LOG_TRIVIAL(info) << "Registry: Registered " << handle_kind_to_string(kind) << " " << id;

  if (entry.watch) {
    start_waiter(kind, id, entry.watch);
  }
}


//==============================================
// LOOKUP
//==============================================

std::shared_ptr<mux::ReadMultiplexer> Registry::find_reader(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = readers_.find(id);
  return it == readers_.end() ? nullptr : it->second.mux;
}

std::shared_ptr<mux::WriteMultiplexer> Registry::find_writer(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = writers_.find(id);
  return it == writers_.end() ? nullptr : it->second.mux;
}

ExposedHandle Registry::find_any(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ExposedHandle found;

  auto reader = readers_.find(id);
  if (reader != readers_.end()) {
    found.reader = reader->second.mux;
    return found;
  }

  auto writer = writers_.find(id);
  if (writer != writers_.end()) {
    found.writer = writer->second.mux;
  }
  return found;
}


//==============================================
// CLOSING
//==============================================

std::size_t Registry::close(const std::string& id) {
  std::size_t closed = 0;
  if (close_reader(id)) {
    ++closed;
  }
  if (close_writer(id)) {
    ++closed;
  }

  if (closed == 0) {
    BOOST_LOG_TRIVIAL(debug) << "Registry: Nothing registered under " << id;
  }
  return closed;
}

bool Registry::close_reader(const std::string& id) {
  return remove_entry<mux::ReadMultiplexer>(readers_, HandleKind::READER, id, nullptr);
}

bool Registry::close_writer(const std::string& id) {
  return remove_entry<mux::WriteMultiplexer>(writers_, HandleKind::WRITER, id, nullptr);
}

void Registry::set_close_handles(bool readers, bool writers) {
  close_readers_ = readers;
  close_writers_ = writers;
}

template <typename Mux>
bool Registry::remove_entry(std::map<std::string, Entry<Mux>>& entries, HandleKind kind,
                            const std::string& id, const Context* expected_watch) {
  Entry<Mux> entry;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries.find(id);
    if (it == entries.end()) {
      return false;
    }
    // A waiter only removes the entry it was started for. The waiter holds its
    // watch alive, so no later registration can carry the same pointer.
    if (expected_watch && it->second.watch.get() != expected_watch) {
      return false;
    }
    entry = std::move(it->second);
    entries.erase(it);
  }

  // Handle close may block, keep it out of the registry lock
  release_entry(kind, id, entry);
  BOOST_LOG_TRIVIAL(info) << "Registry: Closed " << handle_kind_to_string(kind) << " " << id;
  return true;
}

template <typename Mux>
void Registry::release_entry(HandleKind kind, const std::string& id, Entry<Mux>& entry) {
  if (entry.watch) {
    entry.watch->cancel();
  }

  bool close_handle = kind == HandleKind::READER ? close_readers_.load() : close_writers_.load();
  if (!close_handle) {
    return;
  }

  try {
    entry.mux->inspect([](auto& handle) {
      if (auto* closer = dynamic_cast<storage::Closer*>(&handle)) {
        closer->close();
      }
    });
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Registry: Failed to close " << handle_kind_to_string(kind)
                             << " " << id << ": " << e.what();
  }
}


//==============================================
// WAITERS
//==============================================

void Registry::start_waiter(HandleKind kind, const std::string& id, std::shared_ptr<Context> watch) {
  auto finished = std::make_shared<std::atomic<bool>>(false);

  std::thread thread([this, kind, id, watch, finished]() {
    watch->wait();

    if (kind == HandleKind::READER) {
      if (remove_entry(readers_, kind, id, watch.get())) {
        BOOST_LOG_TRIVIAL(info) << "Registry: Context done, auto-closed reader " << id;
      }
    } else {
      if (remove_entry(writers_, kind, id, watch.get())) {
        BOOST_LOG_TRIVIAL(info) << "Registry: Context done, auto-closed writer " << id;
      }
    }

    *finished = true;
  });

  std::lock_guard<std::mutex> lock(waiters_mutex_);
  waiters_.push_back(Waiter{std::move(thread), finished});
}

void Registry::reap_waiters() {
  std::vector<Waiter> done;
  {
    std::lock_guard<std::mutex> lock(waiters_mutex_);
    auto split = std::partition(waiters_.begin(), waiters_.end(),
                                [](const Waiter& waiter) { return !*waiter.finished; });
    std::move(split, waiters_.end(), std::back_inserter(done));
    waiters_.erase(split, waiters_.end());
  }

  for (auto& waiter : done) {
    if (waiter.thread.joinable()) {
      waiter.thread.join();
    }
  }
}


//==============================================
// UTILITY METHODS
//==============================================

std::vector<std::string> Registry::ids() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> result;

  for (const auto& reader : readers_) {
    result.push_back(reader.first);
  }
  for (const auto& writer : writers_) {
    if (readers_.find(writer.first) == readers_.end()) {
      result.push_back(writer.first);
    }
  }

  std::sort(result.begin(), result.end());
  return result;
}

std::size_t Registry::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return readers_.size() + writers_.size();
}

void Registry::shutdown() {
  std::map<std::string, ReaderEntry> readers;
  std::map<std::string, WriterEntry> writers;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    readers.swap(readers_);
    writers.swap(writers_);
  }

  for (auto& reader : readers) {
    release_entry(HandleKind::READER, reader.first, reader.second);
  }
  for (auto& writer : writers) {
    release_entry(HandleKind::WRITER, writer.first, writer.second);
  }

  // Every watch is cancelled by now so the waiters return promptly
  std::vector<Waiter> waiters;
  {
    std::lock_guard<std::mutex> lock(waiters_mutex_);
    waiters.swap(waiters_);
  }
  for (auto& waiter : waiters) {
    if (waiter.thread.joinable()) {
      waiter.thread.join();
    }
  }

  if (!readers.empty() || !writers.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Registry: Shut down, closed " << readers.size() + writers.size() << " handles";
  }
}

} // namespace server
} // namespace netfile
