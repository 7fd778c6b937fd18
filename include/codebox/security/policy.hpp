#pragma once

#include <regex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace codebox::security {

struct PatternRule {
  std::regex regex;
  std::string message;
};

enum class ModuleVerdict { Allowed, Denied, Unlisted };

/// The allow/deny tables every request is checked against. Built once, never
/// mutated; shared freely between threads.
class PolicySet {
public:
  std::unordered_set<std::string> allowed_modules;
  std::unordered_set<std::string> denied_modules;
  std::unordered_set<std::string> denied_builtins;
  std::unordered_set<std::string> denied_attributes;
  std::unordered_set<std::string> file_writer_methods;
  std::unordered_map<std::string, std::unordered_set<std::string>> denied_module_members;
  std::vector<PatternRule> dangerous_patterns;

  [[nodiscard]] static std::string top_level(const std::string &module_name);

  /// The longest dotted prefix of `module_name` listed in either table decides,
  /// with the deny table winning a tie. "urllib.parse" is allowed while
  /// "urllib.request" falls back to the "urllib" deny entry.
  [[nodiscard]] ModuleVerdict classify_module(const std::string &module_name) const;
  [[nodiscard]] bool is_module_allowed(const std::string &module_name) const;
  [[nodiscard]] bool is_module_denied(const std::string &module_name) const;

  [[nodiscard]] bool is_builtin_denied(const std::string &name) const;
  [[nodiscard]] bool is_attribute_denied(const std::string &name) const;

  /// Methods such as DataFrame.to_csv that write when handed a destination.
  [[nodiscard]] bool is_file_writer(const std::string &method) const;

  /// Members are keyed by top-level package so every submodule of it is covered.
  [[nodiscard]] bool is_member_denied(const std::string &module_name,
                                      const std::string &member) const;

  /// Messages of every rule whose pattern occurs in `code`, in table order.
  [[nodiscard]] std::vector<std::string> match_dangerous_patterns(const std::string &code) const;
};

[[nodiscard]] const PolicySet &default_policy();

} // namespace codebox::security
