#ifndef NETFILE_MUX_MULTIPLEXER_HPP
#define NETFILE_MUX_MULTIPLEXER_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include "storage/handle.hpp"

namespace netfile {
namespace mux {

// Shares one seekable handle between many cursors, each keeping its own offset.
// The handle is only repositioned when a different cursor than the last one acts.
template <typename Handle>
class Multiplexer {
public:
  class Cursor {
  public:
    // Cursors are identities, neither copied nor moved. new_cursor() hands
    // them out by guaranteed elision.
    Cursor(const Cursor&) = delete;
    Cursor& operator=(const Cursor&) = delete;
    Cursor(Cursor&&) = delete;
    Cursor& operator=(Cursor&&) = delete;

    storage::IoResult read(char* data, std::size_t size) {
      std::lock_guard<std::mutex> lock(parent_->mutex_);
      reposition();
      storage::IoResult result = parent_->handle_->read(data, size);
      offset_ += static_cast<std::int64_t>(result.bytes);
      return result;
    }

    std::size_t write(const char* data, std::size_t size) {
      std::lock_guard<std::mutex> lock(parent_->mutex_);
      reposition();
      std::size_t n = parent_->handle_->write(data, size);
      offset_ += static_cast<std::int64_t>(n);
      return n;
    }

    std::int64_t seek(std::int64_t offset, storage::Whence whence) {
      std::lock_guard<std::mutex> lock(parent_->mutex_);
      parent_->last_active_ = id_;
      try {
        offset_ = parent_->handle_->seek(offset, whence);
      } catch (...) {
        // Physical position is unknown now, make the next operation reposition
        parent_->last_active_ = NO_CURSOR;
        throw;
      }
      return offset_;
    }

    std::int64_t offset() const { return offset_; }
    std::uint64_t id() const { return id_; }

  private:
    friend class Multiplexer;

    Cursor(Multiplexer& parent, std::uint64_t id)
      : parent_(&parent)
      , id_(id) {}

    // Caller holds the parent lock
    void reposition() {
      if (parent_->last_active_ != id_) {
        parent_->handle_->seek(offset_, storage::Whence::START);
      }
      parent_->last_active_ = id_;
    }

    Multiplexer* parent_;
    std::uint64_t id_;
    std::int64_t offset_ = 0;
  };


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Multiplexer(std::unique_ptr<Handle> handle)
    : handle_(std::move(handle)) {}

  Multiplexer(const Multiplexer&) = delete;
  Multiplexer& operator=(const Multiplexer&) = delete;


  // ---- CURSORS ----
  // The multiplexer must outlive the cursor
  Cursor new_cursor() {
    return Cursor(*this, next_cursor_id());
  }


  // ---- DIRECT HANDLE ACCESS ----
  // Runs f(handle) under the lock without touching the cursor bookkeeping
  template <typename F>
  auto inspect(F&& f) -> decltype(f(std::declval<Handle&>())) {
    std::lock_guard<std::mutex> lock(mutex_);
    return f(*handle_);
  }

  // Runs f(handle) under the lock; f may move the physical position so no
  // cursor is considered positioned afterwards
  template <typename F>
  auto exclusive(F&& f) -> decltype(f(std::declval<Handle&>())) {
    std::lock_guard<std::mutex> lock(mutex_);
    struct Forget {
      std::uint64_t& last_active;
      ~Forget() { last_active = NO_CURSOR; }
    } forget{last_active_};
    return f(*handle_);
  }

  // Handle for capability checks, not for I/O
  Handle& handle() { return *handle_; }

private:
  static constexpr std::uint64_t NO_CURSOR = 0;

  // Process wide so ids never repeat, whichever multiplexer a cursor came from
  static std::uint64_t next_cursor_id() {
    static std::atomic<std::uint64_t> counter{NO_CURSOR};
    return ++counter;
  }

  // ---- PARAMETERS ----
  std::unique_ptr<Handle> handle_;
  std::mutex mutex_;
  std::uint64_t last_active_ = NO_CURSOR;
};

using ReadMultiplexer = Multiplexer<storage::ReadSeeker>;
using WriteMultiplexer = Multiplexer<storage::WriteSeeker>;

} // namespace mux
} // namespace netfile

#endif // NETFILE_MUX_MULTIPLEXER_HPP
