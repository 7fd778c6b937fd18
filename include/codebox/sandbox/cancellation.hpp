#pragma once

#include "codebox/sandbox/python.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace codebox::sandbox {

class CancellationToken {
public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  [[nodiscard]] bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
  std::atomic<bool> cancelled_{false};
};

/// Cancels `token` once `budget` elapses unless disarmed first.
class Watchdog {
public:
  Watchdog(CancellationToken &token, std::chrono::milliseconds budget);
  ~Watchdog();

  Watchdog(const Watchdog &) = delete;
  Watchdog &operator=(const Watchdog &) = delete;

  void disarm();
  [[nodiscard]] bool fired() const { return fired_.load(); }

private:
  void run(std::chrono::steady_clock::time_point deadline);

  CancellationToken &token_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool disarmed_ = false;
  std::atomic<bool> fired_{false};
  std::thread thread_;
};

/// Installs a trace function on the current thread that raises `timeout_type`
/// at every trace event after `token` is cancelled. Guest handlers cannot
/// swallow it: the next line they run raises again. Requires the GIL for its
/// whole lifetime.
class TraceGuard {
public:
  TraceGuard(const CancellationToken &token, py::handle timeout_type);
  ~TraceGuard();

  TraceGuard(const TraceGuard &) = delete;
  TraceGuard &operator=(const TraceGuard &) = delete;

  [[nodiscard]] bool installed() const { return installed_; }

  /// Removes the trace function early. Safe to call more than once.
  void remove();

private:
  struct State {
    const CancellationToken *token;
    py::handle timeout_type;
  };

  static int trace(PyObject *capsule, PyFrameObject *frame, int event, PyObject *arg);

  State state_;
  bool installed_ = false;
};

} // namespace codebox::sandbox
