#pragma once

#include "codebox/engine/executor.hpp"
#include "codebox/tools/tool.hpp"

#include <memory>

namespace codebox::tools {

class RunPythonTool final : public ITool {
public:
  explicit RunPythonTool(std::shared_ptr<engine::Executor> executor);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override;
  [[nodiscard]] std::string_view group() const override;

private:
  std::shared_ptr<engine::Executor> executor_;
};

class ListLibrariesTool final : public ITool {
public:
  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override;
  [[nodiscard]] std::string_view group() const override;
};

/// JSON body of list_available_libraries. Starts the runtime if needed.
[[nodiscard]] std::string describe_libraries();

} // namespace codebox::tools
