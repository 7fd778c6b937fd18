#include "codebox/tools/builtin/python.hpp"

#include "codebox/common/fs.hpp"
#include "codebox/tools/identity.hpp"

#include <algorithm>
#include <limits>

namespace codebox::tools {

namespace {

common::Result<std::optional<std::uint32_t>> parse_timeout(const ToolArgs &args) {
  const auto it = args.find("timeout");
  if (it == args.end() || common::trim(it->second).empty()) {
    return common::Result<std::optional<std::uint32_t>>::success(std::nullopt);
  }
  try {
    std::size_t consumed = 0;
    const std::string value = common::trim(it->second);
    const long long parsed = std::stoll(value, &consumed);
    if (consumed != value.size()) {
      return common::Result<std::optional<std::uint32_t>>::failure("Invalid timeout: " + value);
    }
    const long long bounded =
        std::clamp<long long>(parsed, 0, std::numeric_limits<std::uint32_t>::max());
    return common::Result<std::optional<std::uint32_t>>::success(
        static_cast<std::uint32_t>(bounded));
  } catch (const std::exception &) {
    return common::Result<std::optional<std::uint32_t>>::failure("Invalid timeout: " + it->second);
  }
}

std::optional<std::string> clean_identity(const std::optional<std::string> &value) {
  return value.has_value() ? sanitize_identity(*value) : std::nullopt;
}

} // namespace

RunPythonTool::RunPythonTool(std::shared_ptr<engine::Executor> executor)
    : executor_(std::move(executor)) {}

std::string_view RunPythonTool::name() const { return "run_python"; }

std::string_view RunPythonTool::description() const {
  return "Execute Python code for data analysis in a secure sandbox. Libraries are pre-loaded "
         "(pd, np, json, math, ...); the value of a final bare expression is returned as result";
}

std::string RunPythonTool::parameters_schema() const {
  return R"({"type":"object","required":["code"],"properties":{"code":{"type":"string"},"timeout":{"type":"integer","minimum":1}}})";
}

common::Result<ToolResult> RunPythonTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  const auto code = args.find("code");
  if (code == args.end() || common::trim(code->second).empty()) {
    return common::Result<ToolResult>::failure("Missing code");
  }
  auto timeout = parse_timeout(args);
  if (!timeout.ok()) {
    return common::Result<ToolResult>::failure(timeout.error());
  }

  engine::ExecutionRequest request;
  request.code = code->second;
  request.timeout_seconds = timeout.value();
  request.session_id = clean_identity(ctx.session_id);
  request.run_id = request.session_id.has_value() ? clean_identity(ctx.run_id) : std::nullopt;

  const engine::ExecutionResult executed = executor_->execute(request);

  ToolResult result;
  result.output = engine::to_json(executed);
  result.success = executed.ok;
  result.truncated = executed.truncated;
  if (executed.error.has_value()) {
    result.metadata["error_kind"] = engine::error_kind_to_string(executed.error->kind);
  }
  return common::Result<ToolResult>::success(std::move(result));
}

bool RunPythonTool::is_safe() const { return false; }

std::string_view RunPythonTool::group() const { return "runtime"; }

} // namespace codebox::tools
