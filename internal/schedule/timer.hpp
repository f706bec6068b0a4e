#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "internal/util/time.hpp"

namespace sqlvault::schedule {

/*
  Cancellable timer on its own thread.

  Repeating timers fire every `period`; one-shot timers fire once after
  `period`. Callbacks run on the timer thread, never concurrently with
  themselves. Cancel() wakes the thread immediately and joins it, so it
  waits for a callback that is already running.
*/
class Timer {
 public:
  using Callback = std::function<void()>;

  Timer(std::string name, std::chrono::milliseconds period, bool repeat, Callback callback);
  ~Timer();

  Timer(const Timer&)            = delete;
  Timer& operator=(const Timer&) = delete;

  void Cancel();

  // Wall-clock time of the next firing; nullopt once cancelled or spent.
  std::optional<util::TimePoint> NextFireTime() const;

  const std::string& Name() const {
    return name_;
  }

 private:
  void Run();

  const std::string               name_;
  const std::chrono::milliseconds period_;
  const bool                      repeat_;
  Callback                        callback_;

  mutable std::mutex             mutex_;
  std::condition_variable        cv_;
  bool                           cancelled_ = false;
  std::optional<util::TimePoint> next_fire_;

  std::thread thread_;
};

} // namespace sqlvault::schedule
