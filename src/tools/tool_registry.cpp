#include "codebox/tools/tool_registry.hpp"

#include "codebox/common/fs.hpp"
#include "codebox/tools/builtin/python.hpp"

namespace codebox::tools {

ToolSpec ITool::spec() const {
  return ToolSpec{.name = std::string(name()),
                  .description = std::string(description()),
                  .parameters_json = parameters_schema(),
                  .safe = is_safe(),
                  .group = std::string(group())};
}

void ToolRegistry::register_tool(std::unique_ptr<ITool> tool) {
  ITool *raw = tool.get();
  by_name_[common::to_lower(std::string(raw->name()))] = raw;
  tools_.push_back(std::move(tool));
}

ITool *ToolRegistry::get_tool(const std::string_view name) const {
  const auto it = by_name_.find(common::to_lower(std::string(name)));
  if (it == by_name_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<ToolSpec> ToolRegistry::all_specs() const {
  std::vector<ToolSpec> specs;
  specs.reserve(tools_.size());
  for (const auto &tool : tools_) {
    specs.push_back(tool->spec());
  }
  return specs;
}

ToolRegistry ToolRegistry::create_default(std::shared_ptr<engine::Executor> executor) {
  ToolRegistry registry;
  registry.register_tool(std::make_unique<RunPythonTool>(std::move(executor)));
  registry.register_tool(std::make_unique<ListLibrariesTool>());
  return registry;
}

} // namespace codebox::tools
