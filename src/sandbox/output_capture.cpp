#include "codebox/sandbox/output_capture.hpp"

namespace codebox::sandbox {

namespace {

void detach(py::object &sink) {
  if (sink) {
    sink.cast<OutputSink &>().detach();
  }
}

} // namespace

void CaptureBuffer::append(const std::string &data) {
  const std::size_t capacity = limit_ + 1;
  const std::size_t room = text_.size() < capacity ? capacity - text_.size() : 0;
  std::size_t size = data.size();
  if (size > room) {
    overflowed_ = true;
    size = room;
  }
  text_.append(data, 0, size);
}

std::size_t OutputSink::write(const py::object &text) {
  if (!py::isinstance<py::str>(text)) {
    throw py::type_error("write() argument must be str, not " + type_name(text));
  }
  if (buffer_ != nullptr) {
    buffer_->append(utf8(text));
  }
  return py::len(text);
}

void register_output_sink(py::module_ &scope) {
  py::class_<OutputSink>(scope, "OutputSink", "Captured standard stream.")
      .def("write", &OutputSink::write)
      .def("flush", [](const OutputSink &) {})
      .def("isatty", [](const OutputSink &) { return false; })
      .def("readable", [](const OutputSink &) { return false; })
      .def("seekable", [](const OutputSink &) { return false; })
      .def("writable", [](const OutputSink &) { return true; })
      .def_property_readonly("encoding", [](const OutputSink &) { return "utf-8"; })
      .def_property_readonly("closed", [](const OutputSink &) { return false; });
}

CaptureScope::CaptureScope(std::size_t limit)
    : stdout_buffer_(std::make_unique<CaptureBuffer>(limit)),
      stderr_buffer_(std::make_unique<CaptureBuffer>(limit)) {
  stdout_sink_ = py::cast(OutputSink(stdout_buffer_.get()));
  stderr_sink_ = py::cast(OutputSink(stderr_buffer_.get()));
  if (!stdout_sink_ || !stderr_sink_) {
    // Casting an unregistered class leaves a TypeError pending.
    error_ = "output sink: " + describe(py::error_already_set());
    return;
  }

  auto sys = py::module_::import("sys");
  saved_stdout_ = sys.attr("stdout");
  saved_stderr_ = sys.attr("stderr");
  active_ = true;
  try {
    sys.attr("stdout") = stdout_sink_;
    sys.attr("stderr") = stderr_sink_;
  } catch (const py::error_already_set &error) {
    error_ = describe(error);
    restore();
  }
}

CaptureScope::~CaptureScope() { restore(); }

void CaptureScope::restore() {
  if (!active_) {
    return;
  }
  active_ = false;
  try {
    auto sys = py::module_::import("sys");
    sys.attr("stdout") = saved_stdout_;
    sys.attr("stderr") = saved_stderr_;
  } catch (const py::error_already_set &error) {
    error_ = describe(error);
  }
  detach(stdout_sink_);
  detach(stderr_sink_);
}

} // namespace codebox::sandbox
