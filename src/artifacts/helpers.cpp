#include "codebox/artifacts/helpers.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace codebox::artifacts {

namespace {

using Context = std::shared_ptr<HelperContext>;

struct HelperDoc {
  const char *name;
  const char *doc;
};

constexpr std::array kHelperDocs = {
    HelperDoc{"fetch_artifact", "fetch_artifact(path) - Get raw bytes from artifact store"},
    HelperDoc{"fetch_artifact_json", "fetch_artifact_json(path) - Get JSON as dict/list"},
    HelperDoc{"fetch_artifact_csv", "fetch_artifact_csv(path) - Get CSV as pandas DataFrame"},
    HelperDoc{"upload_artifact", "upload_artifact(path, data, content_type) - Upload bytes"},
    HelperDoc{"upload_dataframe", "upload_dataframe(path, df, format) - Upload DataFrame"},
};

/// Time a helper may spend on one request, or nullopt once the budget is gone.
std::optional<std::chrono::milliseconds> request_timeout(const HelperContext &context,
                                                         std::chrono::milliseconds configured) {
  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      context.deadline - std::chrono::steady_clock::now());
  if (remaining.count() <= 0) {
    return std::nullopt;
  }
  return std::min(configured, remaining);
}

void require_store(const HelperContext &context) {
  if (!context.store || !context.store->configured()) {
    throw std::runtime_error("artifact store is not configured");
  }
}

py::bytes fetch_bytes(const HelperContext &context, const std::string &path) {
  require_store(context);
  const auto timeout = request_timeout(context, context.fetch_timeout);
  if (!timeout) {
    throw std::runtime_error("execution time budget exhausted");
  }
  auto result = [&] {
    py::gil_scoped_release release;
    return context.store->fetch(context.session_id, path, *timeout);
  }();
  if (!result.ok()) {
    throw std::runtime_error(result.error());
  }
  return py::bytes(result.value());
}

py::object upload_payload(const HelperContext &context, const std::string &path,
                          const std::string &data, const std::string &content_type) {
  require_store(context);
  if (!context.run_id.has_value()) {
    throw std::runtime_error("No run_id available - cannot determine artifact path");
  }
  const auto timeout = request_timeout(context, context.upload_timeout);
  if (!timeout) {
    throw std::runtime_error("execution time budget exhausted");
  }

  const std::string canonical = build_canonical_path(path, context.run_id);
  auto result = [&] {
    py::gil_scoped_release release;
    return context.store->upload(context.session_id, canonical, data, content_type, *timeout);
  }();
  if (!result.ok()) {
    throw std::runtime_error(result.error());
  }

  py::object response = py::module_::import("json").attr("loads")(result.value());
  if (py::isinstance<py::dict>(response)) {
    response["canonical_path"] = canonical;
    response["session_id"] = context.session_id;
    response["run_id"] = *context.run_id;
  }
  return response;
}

/// str is sent as UTF-8; bytes-like objects are sent as-is.
std::string payload_bytes(const py::object &data) {
  if (py::isinstance<py::str>(data)) {
    return sandbox::utf8(data);
  }
  if (py::isinstance<py::bytes>(data)) {
    return std::string(data.cast<py::bytes>());
  }
  if (py::isinstance<py::bytearray>(data)) {
    return std::string(data.cast<py::bytearray>());
  }
  throw py::type_error("data must be str or bytes, not " + sandbox::type_name(data));
}

py::object rows_to_csv(const py::list &rows) {
  py::object buffer = py::module_::import("io").attr("StringIO")();
  py::list fieldnames;
  if (!rows.empty()) {
    if (!py::isinstance<py::dict>(rows[0])) {
      throw py::type_error("rows must be dicts");
    }
    fieldnames = py::list(rows[0].attr("keys")());
  }
  py::object writer =
      py::module_::import("csv").attr("DictWriter")(buffer, py::arg("fieldnames") = fieldnames);
  writer.attr("writeheader")();
  writer.attr("writerows")(rows);
  return buffer.attr("getvalue")();
}

py::object serialize_table(const py::object &table, const std::string &format) {
  if (py::hasattr(table, "to_csv") && py::hasattr(table, "to_json")) {
    if (format == "csv") {
      return table.attr("to_csv")(py::arg("index") = false);
    }
    return table.attr("to_json")(py::arg("orient") = "records", py::arg("date_format") = "iso");
  }
  if (!py::isinstance<py::list>(table)) {
    throw py::type_error("expected a DataFrame or a list of dicts, not " +
                         sandbox::type_name(table));
  }
  if (format == "csv") {
    return rows_to_csv(table.cast<py::list>());
  }
  return py::module_::import("json").attr("dumps")(
      table, py::arg("default") = py::module_::import("builtins").attr("str"));
}

py::object fetch_artifact_csv(const HelperContext &context, const std::string &path,
                              const py::kwargs &kwargs) {
  py::bytes data = fetch_bytes(context, path);
  if (context.pandas_available) {
    py::object buffer = py::module_::import("io").attr("BytesIO")(data);
    return py::module_::import("pandas").attr("read_csv")(buffer, **kwargs);
  }
  py::object text = data.attr("decode")("utf-8", "replace");
  py::object stream = py::module_::import("io").attr("StringIO")(text);
  return py::list(py::module_::import("csv").attr("DictReader")(stream, **kwargs));
}

py::object upload_dataframe(const HelperContext &context, const std::string &path,
                            const py::object &table, const std::string &format) {
  if (format != "csv" && format != "json") {
    throw py::value_error("Unsupported format: " + format + ". Use 'csv' or 'json'.");
  }
  const std::string payload = payload_bytes(serialize_table(table, format));
  return upload_payload(context, path, payload, format == "csv" ? "text/csv" : "application/json");
}

} // namespace

const std::vector<std::string> &helper_signatures() {
  static const std::vector<std::string> signatures = [] {
    std::vector<std::string> out;
    for (const auto &helper : kHelperDocs) {
      out.emplace_back(helper.doc);
    }
    return out;
  }();
  return signatures;
}

common::Status bind_helpers(py::dict &globals, const std::shared_ptr<HelperContext> &context) {
  try {
    globals["fetch_artifact"] = py::cpp_function(
        [context](const std::string &path) { return fetch_bytes(*context, path); },
        py::name(kHelperDocs[0].name), py::arg("path"), kHelperDocs[0].doc);
    globals["fetch_artifact_json"] = py::cpp_function(
        [context](const std::string &path) {
          return py::module_::import("json").attr("loads")(fetch_bytes(*context, path));
        },
        py::name(kHelperDocs[1].name), py::arg("path"), kHelperDocs[1].doc);
    globals["fetch_artifact_csv"] = py::cpp_function(
        [context](const std::string &path, const py::kwargs &kwargs) {
          return fetch_artifact_csv(*context, path, kwargs);
        },
        py::name(kHelperDocs[2].name), py::arg("path"), kHelperDocs[2].doc);
    globals["upload_artifact"] = py::cpp_function(
        [context](const std::string &path, const py::object &data,
                  const std::string &content_type) {
          return upload_payload(*context, path, payload_bytes(data), content_type);
        },
        py::name(kHelperDocs[3].name), py::arg("path"), py::arg("data"),
        py::arg("content_type") = "application/octet-stream", kHelperDocs[3].doc);
    globals["upload_dataframe"] = py::cpp_function(
        [context](const std::string &path, const py::object &df, const std::string &format) {
          return upload_dataframe(*context, path, df, format);
        },
        py::name(kHelperDocs[4].name), py::arg("path"), py::arg("df"),
        py::arg("format") = "csv", kHelperDocs[4].doc);

    globals["_session_id"] = context->session_id;
    globals["_run_id"] = context->run_id.has_value() ? py::object(py::str(*context->run_id))
                                                     : py::object(py::none());
  } catch (const py::error_already_set &error) {
    return common::Status::error("artifact helpers: " + sandbox::describe(error));
  }
  return common::Status::success();
}

} // namespace codebox::artifacts
