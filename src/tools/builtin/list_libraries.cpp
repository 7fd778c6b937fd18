#include "codebox/tools/builtin/python.hpp"

#include "codebox/artifacts/helpers.hpp"
#include "codebox/common/json_util.hpp"
#include "codebox/sandbox/runtime.hpp"

#include <sstream>

namespace codebox::tools {

std::string describe_libraries() {
  auto &runtime = sandbox::Runtime::instance();
  const auto status = runtime.start();

  std::ostringstream out;
  out << "{\"ok\":" << (status.ok() ? "true" : "false");
  out << ",\"runtime\":{\"python\":" << common::json_quote(runtime.python_version());
  out << ",\"status\":" << common::json_quote(status.ok() ? "ready" : status.error()) << "}";

  out << ",\"libraries\":{";
  bool first = true;
  for (const auto &library : runtime.catalog().libraries()) {
    if (!first) {
      out << ",";
    }
    first = false;
    const bool available = library.status == sandbox::LibraryStatus::Loaded;
    out << common::json_quote(library.name) << ":{\"available\":" << (available ? "true" : "false");
    if (available && !library.version.empty()) {
      out << ",\"version\":" << common::json_quote(library.version);
    }
    if (!library.alias.empty()) {
      out << ",\"alias\":" << common::json_quote(library.alias);
    }
    if (library.status == sandbox::LibraryStatus::Failed) {
      out << ",\"error\":" << common::json_quote(library.error);
    }
    out << "}";
  }
  out << "}";

  out << ",\"helper_functions\":[";
  const auto &signatures = artifacts::helper_signatures();
  for (std::size_t i = 0; i < signatures.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << common::json_quote(signatures[i]);
  }
  out << "]}";
  return out.str();
}

std::string_view ListLibrariesTool::name() const { return "list_available_libraries"; }

std::string_view ListLibrariesTool::description() const {
  return "List the libraries pre-loaded into the Python sandbox and the artifact helpers";
}

std::string ListLibrariesTool::parameters_schema() const {
  return R"({"type":"object","properties":{}})";
}

common::Result<ToolResult> ListLibrariesTool::execute(const ToolArgs &, const ToolContext &) {
  ToolResult result;
  result.output = describe_libraries();
  return common::Result<ToolResult>::success(std::move(result));
}

bool ListLibrariesTool::is_safe() const { return true; }

std::string_view ListLibrariesTool::group() const { return "runtime"; }

} // namespace codebox::tools
