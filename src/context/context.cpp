#include "context/context.hpp"
#include <algorithm>

namespace netfile {

//==============================================
// FACTORIES
//==============================================

Context::Context(std::optional<Clock::time_point> deadline)
  : deadline_(deadline) {
}

std::shared_ptr<Context> Context::create(std::optional<Clock::time_point> deadline,
                                         const std::shared_ptr<Context>& parent) {
  if (parent && parent->deadline_) {
    deadline = deadline ? std::min(*deadline, *parent->deadline_) : parent->deadline_;
  }

  std::shared_ptr<Context> context(new Context(deadline));
  if (!parent) {
    return context;
  }

  bool parent_cancelled;
  {
    std::lock_guard<std::mutex> lock(parent->mutex_);
    parent_cancelled = parent->cancelled_;
    if (!parent_cancelled) {
      // Drop children that are gone before adding the new one
      auto& children = parent->children_;
      children.erase(std::remove_if(children.begin(), children.end(),
                                    [](const std::weak_ptr<Context>& child) { return child.expired(); }),
                     children.end());
      children.push_back(context);
    }
  }

  if (parent_cancelled) {
    context->cancel();
  }
  return context;
}

std::shared_ptr<Context> Context::background() {
  return create(std::nullopt, nullptr);
}

std::shared_ptr<Context> Context::with_cancel(const std::shared_ptr<Context>& parent) {
  return create(std::nullopt, parent);
}

std::shared_ptr<Context> Context::with_timeout(Clock::duration timeout,
                                               const std::shared_ptr<Context>& parent) {
  return create(Clock::now() + timeout, parent);
}

std::shared_ptr<Context> Context::with_deadline(Clock::time_point deadline,
                                                const std::shared_ptr<Context>& parent) {
  return create(deadline, parent);
}


//==============================================
// SIGNALLING
//==============================================

void Context::cancel() {
  std::vector<std::weak_ptr<Context>> children;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
      return;
    }
    cancelled_ = true;
    children.swap(children_);
  }
  cv_.notify_all();

  for (auto& weak_child : children) {
    if (auto child = weak_child.lock()) {
      child->cancel();
    }
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool Context::done() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_ || deadline_passed();
}

ErrorKind Context::reason() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!cancelled_ && deadline_passed()) {
    return ErrorKind::DEADLINE_EXCEEDED;
  }
  return ErrorKind::CANCELLED;
}

bool Context::deadline_passed() const {
  return deadline_ && Clock::now() >= *deadline_;
}


//==============================================
// WAITING
//==============================================

void Context::wait() const {
  std::unique_lock<std::mutex> lock(mutex_);
  if (deadline_) {
    cv_.wait_until(lock, *deadline_, [this] { return cancelled_; });
  } else {
    cv_.wait(lock, [this] { return cancelled_; });
  }
}

bool Context::wait_for(Clock::duration timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  auto until = Clock::now() + timeout;
  if (deadline_ && *deadline_ < until) {
    until = *deadline_;
  }
  cv_.wait_until(lock, until, [this] { return cancelled_; });
  return cancelled_ || deadline_passed();
}

} // namespace netfile
