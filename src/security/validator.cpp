#include "codebox/security/validator.hpp"

#include "codebox/sandbox/python.hpp"

#include <algorithm>
#include <array>
#include <optional>

namespace codebox::security {

namespace {

constexpr const char *kSourceName = "<user_code>";

// Keyword names the writer methods use for their destination.
constexpr std::array kDestinationKeywords = {"path_or_buf", "path_or_buffer", "path", "buf",
                                             "excel_writer", "fname", "file", "fid", "fp"};

struct AstApi {
  py::object iter_child_nodes;
  py::object import_node;
  py::object import_from;
  py::object call;
  py::object name;
  py::object attribute;
  py::object constant;
};

AstApi load_ast_api(const py::module_ &ast) {
  return AstApi{.iter_child_nodes = ast.attr("iter_child_nodes"),
                .import_node = ast.attr("Import"),
                .import_from = ast.attr("ImportFrom"),
                .call = ast.attr("Call"),
                .name = ast.attr("Name"),
                .attribute = ast.attr("Attribute"),
                .constant = ast.attr("Constant")};
}

std::optional<std::string> string_attr(const py::handle &node, const char *name) {
  const py::object value = py::getattr(node, name, py::none());
  if (!py::isinstance<py::str>(value)) {
    return std::nullopt;
  }
  return sandbox::utf8(value);
}

long int_attr(const py::handle &node, const char *name) {
  const py::object value = py::getattr(node, name, py::none());
  if (!py::isinstance<py::int_>(value)) {
    return 0;
  }
  return value.cast<long>();
}

std::string syntax_violation(long line, const std::string &reason) {
  return "Syntax error on line " + std::to_string(line) + ": " + reason;
}

std::string describe_parse_failure(const py::error_already_set &error) {
  long line = 1;
  std::string reason;
  if (error.matches(PyExc_SyntaxError)) {
    line = std::max(1L, int_attr(error.value(), "lineno"));
    reason = string_attr(error.value(), "msg").value_or("");
  }
  if (reason.empty()) {
    reason = sandbox::describe(error);
  }
  return syntax_violation(line, reason);
}

bool is_none_constant(const AstApi &api, const py::handle &node) {
  return py::isinstance(node, api.constant) && node.attr("value").is_none();
}

/// `df.to_csv(path)`, `arr.tofile(f)`: a writer method handed anything but None
/// as its destination.
bool writes_to_destination(const AstApi &api, const py::handle &call) {
  const py::list args = call.attr("args");
  if (!args.empty() && !is_none_constant(api, args[0])) {
    return true;
  }
  for (const auto keyword : call.attr("keywords")) {
    const auto arg = string_attr(keyword, "arg");
    // **kwargs may carry a destination.
    if (!arg) {
      return true;
    }
    const bool destination = std::find(kDestinationKeywords.begin(), kDestinationKeywords.end(),
                                       *arg) != kDestinationKeywords.end();
    if (destination && !is_none_constant(api, keyword.attr("value"))) {
      return true;
    }
  }
  return false;
}

void check_import(const PolicySet &policy, const std::string &module_name,
                  std::vector<std::string> &violations) {
  switch (policy.classify_module(module_name)) {
  case ModuleVerdict::Allowed:
    return;
  case ModuleVerdict::Denied:
    violations.push_back("Import blocked: '" + module_name +
                         "' is not permitted for security reasons");
    return;
  case ModuleVerdict::Unlisted:
    violations.push_back("Import not permitted: '" + module_name +
                         "'. Only data-analysis libraries are allowed.");
    return;
  }
}

void walk(const PolicySet &policy, const AstApi &api, const py::object &tree,
          std::vector<std::string> &violations) {
  // Pre-order walk; children are pushed reversed so source order is kept.
  std::vector<py::object> stack{tree};
  while (!stack.empty()) {
    const py::object node = std::move(stack.back());
    stack.pop_back();

    if (py::isinstance(node, api.import_node)) {
      for (const auto alias : node.attr("names")) {
        if (auto name = string_attr(alias, "name")) {
          check_import(policy, *name, violations);
        }
      }
    } else if (py::isinstance(node, api.import_from)) {
      const auto module_name = string_attr(node, "module");
      if (int_attr(node, "level") > 0) {
        violations.push_back("Relative imports are not permitted");
      } else if (module_name) {
        const std::size_t before = violations.size();
        check_import(policy, *module_name, violations);
        if (violations.size() == before) {
          for (const auto alias : node.attr("names")) {
            const auto member = string_attr(alias, "name");
            if (!member) {
              continue;
            }
            if (policy.is_module_denied(*module_name + "." + *member)) {
              check_import(policy, *module_name + "." + *member, violations);
            } else if (policy.is_member_denied(*module_name, *member)) {
              violations.push_back("Blocked import: '" + *member + "' from '" + *module_name +
                                   "' is not permitted in the sandbox");
            }
          }
        }
      }
    } else if (py::isinstance(node, api.call)) {
      const py::object func = node.attr("func");
      if (py::isinstance(func, api.name)) {
        const auto id = string_attr(func, "id");
        if (id && policy.is_builtin_denied(*id)) {
          violations.push_back("Blocked function: '" + *id +
                               "()' is not permitted for security reasons");
        }
      } else if (py::isinstance(func, api.attribute)) {
        const auto method = string_attr(func, "attr");
        if (method && policy.is_file_writer(*method) && writes_to_destination(api, node)) {
          violations.push_back("Blocked call: '." + *method +
                               "()' cannot write to a file; return the data or upload it "
                               "as an artifact instead");
        }
      }
    } else if (py::isinstance(node, api.attribute)) {
      const auto attr = string_attr(node, "attr");
      if (attr && policy.is_attribute_denied(*attr)) {
        violations.push_back("Blocked access: '." + *attr +
                             "' is not permitted for security reasons");
      } else if (attr) {
        const py::object value = node.attr("value");
        const auto owner = py::isinstance(value, api.name) ? string_attr(value, "id") : std::nullopt;
        if (owner && policy.is_member_denied(*owner, *attr)) {
          violations.push_back("Blocked access: '" + *owner + "." + *attr +
                               "' is not permitted in the sandbox");
        }
      }
    }

    const py::list children = api.iter_child_nodes(node);
    for (auto i = children.size(); i > 0; --i) {
      stack.emplace_back(children[i - 1]);
    }
  }
}

} // namespace

CodeValidator::CodeValidator(const PolicySet &policy) : policy_(policy) {}

ValidationOutcome CodeValidator::validate(const std::string &code) const {
  ValidationOutcome outcome;

  // The C parser stops at the first NUL, so catch it before handing the text over.
  if (const auto nul = code.find('\0'); nul != std::string::npos) {
    const long line = 1 + static_cast<long>(std::count(code.begin(), code.begin() + nul, '\n'));
    outcome.is_valid = false;
    outcome.violations.push_back(syntax_violation(line, "source code cannot contain null bytes"));
    return outcome;
  }

  try {
    const auto ast = py::module_::import("ast");
    py::object tree;
    try {
      tree = ast.attr("parse")(code, kSourceName);
    } catch (const py::error_already_set &error) {
      outcome.is_valid = false;
      outcome.violations.push_back(describe_parse_failure(error));
      return outcome;
    }
    walk(policy_, load_ast_api(ast), tree, outcome.violations);
  } catch (const py::error_already_set &error) {
    outcome.is_valid = false;
    outcome.violations.push_back("Validator unavailable: " + sandbox::describe(error));
    return outcome;
  }

  for (auto &message : policy_.match_dangerous_patterns(code)) {
    outcome.violations.push_back(std::move(message));
  }
  outcome.is_valid = outcome.violations.empty();
  return outcome;
}

} // namespace codebox::security
