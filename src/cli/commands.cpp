#include "codebox/cli/commands.hpp"

#include "codebox/artifacts/store.hpp"
#include "codebox/common/fs.hpp"
#include "codebox/config/config.hpp"
#include "codebox/engine/executor.hpp"
#include "codebox/observability/factory.hpp"
#include "codebox/observability/global.hpp"
#include "codebox/sandbox/python.hpp"
#include "codebox/sandbox/runtime.hpp"
#include "codebox/security/validator.hpp"
#include "codebox/tools/builtin/python.hpp"
#include "codebox/tools/identity.hpp"
#include "codebox/tools/tool_registry.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace codebox::cli {

namespace {

/// Whole seconds in [1, UINT32_MAX]; the executor clamps further to its maximum.
std::optional<std::uint32_t> parse_timeout_option(const std::string &text) {
  try {
    std::size_t consumed = 0;
    const long long parsed = std::stoll(text, &consumed);
    if (consumed != text.size() || parsed < 1 ||
        parsed > static_cast<long long>(std::numeric_limits<std::uint32_t>::max())) {
      return std::nullopt;
    }
    return static_cast<std::uint32_t>(parsed);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::string version_string() {
#ifdef CODEBOX_VERSION
  const std::string version = CODEBOX_VERSION;
#else
  const std::string version = "0.1.0";
#endif
  return "codebox " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || args[i] == short_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

common::Result<std::string> read_source(const std::string &target) {
  if (target == "-") {
    return common::Result<std::string>::success(read_stdin_all());
  }
  return common::read_file(common::expand_path(target));
}

/// Loads config, reports validation problems, and installs the configured observer.
common::Result<config::Config> prepare_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  auto checked = config::validate_config(cfg.value());
  if (!checked.ok()) {
    return common::Result<config::Config>::failure("invalid config: " + checked.error());
  }
  observability::set_global_observer(observability::create_observer(cfg.value().observability));
  for (const auto &warning : checked.value()) {
    observability::record_error("config", warning);
  }
  return cfg;
}

void print_human(const engine::ExecutionResult &result) {
  if (!result.output.empty()) {
    std::cout << result.output;
    if (result.output.back() != '\n') {
      std::cout << "\n";
    }
  }
  if (result.ok) {
    if (result.result.has_value()) {
      std::cout << "=> " << *result.result << "\n";
    }
    return;
  }

  const engine::ErrorRecord &error = *result.error;
  std::cerr << "error (" << engine::error_kind_to_string(error.kind) << "): " << error.message
            << "\n";
  for (const auto &violation : error.violations) {
    std::cerr << "  - " << violation << "\n";
  }
  if (!error.traceback.empty()) {
    std::cerr << error.traceback << "\n";
  }
}

int run_run(std::vector<std::string> args) {
  std::string timeout;
  std::string session;
  std::string run_id;
  take_option(args, "--timeout", "-t", timeout);
  take_option(args, "--session", "-s", session);
  take_option(args, "--run", "-r", run_id);
  const bool as_json = take_flag(args, "--json");
  if (args.size() != 1) {
    std::cerr << "usage: codebox run [--timeout N] [--session ID] [--run ID] [--json] <file|->\n";
    return 1;
  }
  std::optional<std::uint32_t> timeout_seconds;
  if (!timeout.empty()) {
    timeout_seconds = parse_timeout_option(timeout);
    if (!timeout_seconds) {
      std::cerr << "invalid --timeout: " << timeout << " (expected whole seconds, at least 1)\n";
      return 1;
    }
  }

  auto source = read_source(args[0]);
  if (!source.ok()) {
    std::cerr << source.error() << "\n";
    return 1;
  }
  auto cfg = prepare_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  auto store = std::make_shared<artifacts::HttpArtifactStore>(cfg.value().artifact_store);
  auto executor = std::make_shared<engine::Executor>(cfg.value(), store);

  tools::ToolContext ctx;
  ctx.session_id = tools::sanitize_identity(session);
  ctx.run_id = tools::sanitize_identity(run_id);

  if (as_json) {
    auto registry = tools::ToolRegistry::create_default(executor);
    tools::ITool *tool = registry.get_tool("run_python");
    tools::ToolArgs tool_args{{"code", source.value()}};
    if (!timeout.empty()) {
      tool_args["timeout"] = timeout;
    }
    auto result = tool->execute(tool_args, ctx);
    if (!result.ok()) {
      std::cerr << result.error() << "\n";
      return 1;
    }
    std::cout << result.value().output << "\n";
    return result.value().success ? 0 : 1;
  }

  engine::ExecutionRequest request;
  request.code = source.value();
  request.timeout_seconds = timeout_seconds;
  request.session_id = ctx.session_id;
  request.run_id = ctx.session_id.has_value() ? ctx.run_id : std::nullopt;

  const auto result = executor->execute(request);
  print_human(result);
  return result.ok ? 0 : 1;
}

int run_validate(std::vector<std::string> args) {
  if (args.size() != 1) {
    std::cerr << "usage: codebox validate <file|->\n";
    return 1;
  }
  auto source = read_source(args[0]);
  if (!source.ok()) {
    std::cerr << source.error() << "\n";
    return 1;
  }

  auto &runtime = sandbox::Runtime::instance();
  const auto status = runtime.start();
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }

  security::ValidationOutcome outcome;
  {
    py::gil_scoped_acquire gil;
    outcome = security::CodeValidator().validate(source.value());
  }
  if (outcome.is_valid) {
    std::cout << "valid\n";
    return 0;
  }
  for (const auto &violation : outcome.violations) {
    std::cout << violation << "\n";
  }
  return 1;
}

int run_libraries() {
  auto cfg = prepare_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  std::cout << tools::describe_libraries() << "\n";
  return 0;
}

} // namespace

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: codebox [--config PATH] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  run [--timeout N] [--session ID] [--run ID] [--json] <file|->\n";
  std::cout << "                  Validate and execute Python code in the sandbox\n";
  std::cout << "  validate <file|->\n";
  std::cout << "                  Run the static checks only\n";
  std::cout << "  libraries       List pre-loaded libraries and artifact helpers\n";
  std::cout << "  config-path     Print the config file location\n";
  std::cout << "  version         Show version\n";
  std::cout << "  help            Show this help\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "run") {
    return run_run(std::move(args));
  }
  if (subcommand == "validate") {
    return run_validate(std::move(args));
  }
  if (subcommand == "libraries") {
    return run_libraries();
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace codebox::cli
