#include "timer.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace sqlvault::schedule {

Timer::Timer(std::string name, std::chrono::milliseconds period, bool repeat, Callback callback)
    : name_(std::move(name)), period_(period < std::chrono::milliseconds(1) ? std::chrono::milliseconds(1) : period), repeat_(repeat),
      callback_(std::move(callback)) {
  next_fire_ = util::Now() + period_;
  thread_    = std::thread(&Timer::Run, this);
}

Timer::~Timer() {
  Cancel();
}

void Timer::Cancel() {
  {
    std::lock_guard lock(mutex_);
    cancelled_ = true;
    next_fire_.reset();
  }
  cv_.notify_all();

  // a callback cancelling its own timer must not join itself
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  }
}

std::optional<util::TimePoint> Timer::NextFireTime() const {
  std::lock_guard lock(mutex_);
  return next_fire_;
}

void Timer::Run() {
  auto deadline = std::chrono::steady_clock::now() + period_;

  std::unique_lock lock(mutex_);
  while (!cancelled_) {
    if (cv_.wait_until(lock, deadline, [&] { return cancelled_; })) break;

    lock.unlock();
    try {
      callback_();
    } catch (const std::exception& e) {
      SQLVAULT_LOG_ERROR("Timer callback failed", {observability::StringField("timer", name_), observability::StringField("error", e.what())});
    }
    lock.lock();

    if (!repeat_) {
      next_fire_.reset();
      break;
    }

    // a callback that overran its period does not cause a burst of catch-up firings
    const auto now = std::chrono::steady_clock::now();
    deadline += period_;
    if (deadline <= now) deadline = now + period_;

    if (!cancelled_) next_fire_ = util::Now() + std::chrono::duration_cast<util::Clock::duration>(deadline - now);
  }
}

} // namespace sqlvault::schedule
