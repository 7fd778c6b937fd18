#pragma once

#include "codebox/sandbox/python.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace codebox::sandbox {

/// Accumulates one stream. Keeps at most `limit + 1` bytes so callers can tell a
/// stream that exactly filled the limit from one that overflowed it.
class CaptureBuffer {
public:
  explicit CaptureBuffer(std::size_t limit) : limit_(limit) {}

  void append(const std::string &data);
  [[nodiscard]] const std::string &text() const { return text_; }
  [[nodiscard]] bool overflowed() const { return overflowed_; }

private:
  std::size_t limit_;
  std::string text_;
  bool overflowed_ = false;
};

/// File-like object installed as sys.stdout / sys.stderr. Writes after
/// detach() are accepted and dropped.
class OutputSink {
public:
  explicit OutputSink(CaptureBuffer *buffer) : buffer_(buffer) {}

  [[nodiscard]] std::size_t write(const py::object &text);
  void detach() { buffer_ = nullptr; }

private:
  CaptureBuffer *buffer_;
};

/// Adds the OutputSink class to the embedded `codebox` module.
void register_output_sink(py::module_ &scope);

/// Swaps sys.stdout and sys.stderr for sinks writing into host buffers and puts
/// the originals back on destruction. Construct and destroy with the GIL held.
class CaptureScope {
public:
  explicit CaptureScope(std::size_t limit);
  ~CaptureScope();

  CaptureScope(const CaptureScope &) = delete;
  CaptureScope &operator=(const CaptureScope &) = delete;

  [[nodiscard]] bool active() const { return active_; }
  [[nodiscard]] const std::string &error() const { return error_; }

  /// Restores the original streams early. Safe to call more than once.
  void restore();

  [[nodiscard]] const CaptureBuffer &stdout_buffer() const { return *stdout_buffer_; }
  [[nodiscard]] const CaptureBuffer &stderr_buffer() const { return *stderr_buffer_; }

private:
  std::unique_ptr<CaptureBuffer> stdout_buffer_;
  std::unique_ptr<CaptureBuffer> stderr_buffer_;
  py::object stdout_sink_;
  py::object stderr_sink_;
  py::object saved_stdout_;
  py::object saved_stderr_;
  bool active_ = false;
  std::string error_;
};

} // namespace codebox::sandbox
