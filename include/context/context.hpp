#ifndef NETFILE_CONTEXT_HPP
#define NETFILE_CONTEXT_HPP

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "error/netfile_error.hpp"

namespace netfile {

// Cancellation signal with an optional deadline. Children are done whenever
// their parent is, and inherit the earliest deadline along the chain.
class Context {
public:
  using Clock = std::chrono::steady_clock;

  // Delete copy constructor and assignment operator
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;


  // ---- FACTORIES ----
  // Never fires unless cancelled explicitly
  static std::shared_ptr<Context> background();
  static std::shared_ptr<Context> with_cancel(const std::shared_ptr<Context>& parent = nullptr);
  static std::shared_ptr<Context> with_timeout(Clock::duration timeout,
                                               const std::shared_ptr<Context>& parent = nullptr);
  static std::shared_ptr<Context> with_deadline(Clock::time_point deadline,
                                                const std::shared_ptr<Context>& parent = nullptr);


  // ---- SIGNALLING ----
  // Cancels this context and every child, only the first call has an effect
  void cancel();


  // ---- QUERY OPERATIONS ----
  bool done() const;
  // CANCELLED or DEADLINE_EXCEEDED, only meaningful once done() is true
  ErrorKind reason() const;
  std::optional<Clock::time_point> deadline() const { return deadline_; }


  // ---- WAITING ----
  // Blocks until the context is done
  void wait() const;
  // Returns true if the context became done within the timeout
  bool wait_for(Clock::duration timeout) const;

private:
  explicit Context(std::optional<Clock::time_point> deadline);

  static std::shared_ptr<Context> create(std::optional<Clock::time_point> deadline,
                                         const std::shared_ptr<Context>& parent);

  bool deadline_passed() const;

  // ---- PARAMETERS ----
  const std::optional<Clock::time_point> deadline_;
  bool cancelled_ = false;
  std::vector<std::weak_ptr<Context>> children_;
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
};

} // namespace netfile

#endif // NETFILE_CONTEXT_HPP
