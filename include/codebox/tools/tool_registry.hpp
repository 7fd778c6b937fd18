#pragma once

#include "codebox/engine/executor.hpp"
#include "codebox/tools/tool.hpp"

#include <memory>
#include <unordered_map>
#include <vector>

namespace codebox::tools {

class ToolRegistry {
public:
  ToolRegistry() = default;

  void register_tool(std::unique_ptr<ITool> tool);
  [[nodiscard]] ITool *get_tool(std::string_view name) const;
  [[nodiscard]] std::vector<ToolSpec> all_specs() const;

  /// run_python and list_available_libraries over one shared executor.
  [[nodiscard]] static ToolRegistry create_default(std::shared_ptr<engine::Executor> executor);

private:
  std::vector<std::unique_ptr<ITool>> tools_;
  std::unordered_map<std::string, ITool *> by_name_;
};

} // namespace codebox::tools
