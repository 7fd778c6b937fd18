#include "codebox/sandbox/cancellation.hpp"

namespace codebox::sandbox {

namespace {

constexpr const char *kTraceCapsule = "codebox.trace_state";

} // namespace

Watchdog::Watchdog(CancellationToken &token, const std::chrono::milliseconds budget)
    : token_(token) {
  const auto deadline = std::chrono::steady_clock::now() + budget;
  thread_ = std::thread([this, deadline] { run(deadline); });
}

Watchdog::~Watchdog() {
  disarm();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Watchdog::disarm() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    disarmed_ = true;
  }
  cv_.notify_all();
}

void Watchdog::run(const std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (cv_.wait_until(lock, deadline, [this] { return disarmed_; })) {
    return;
  }
  fired_.store(true);
  token_.cancel();
}

TraceGuard::TraceGuard(const CancellationToken &token, py::handle timeout_type)
    : state_{&token, timeout_type} {
  // The capsule only points at state_; PyEval_SetTrace keeps it alive until
  // remove() swaps the trace function out.
  const py::capsule capsule(&state_, kTraceCapsule);
  PyEval_SetTrace(&TraceGuard::trace, capsule.ptr());
  installed_ = true;
}

int TraceGuard::trace(PyObject *capsule, PyFrameObject *, int, PyObject *) {
  auto *state = static_cast<State *>(PyCapsule_GetPointer(capsule, kTraceCapsule));
  if (state == nullptr) {
    return -1;
  }
  if (!state->token->is_cancelled()) {
    return 0;
  }
  PyErr_SetString(state->timeout_type.ptr(), "execution timed out");
  return -1;
}

TraceGuard::~TraceGuard() { remove(); }

void TraceGuard::remove() {
  if (!installed_) {
    return;
  }
  installed_ = false;
  PyEval_SetTrace(nullptr, nullptr);
}

} // namespace codebox::sandbox
