#pragma once

#include "codebox/security/policy.hpp"

#include <string>
#include <vector>

namespace codebox::security {

struct ValidationOutcome {
  bool is_valid = true;
  std::vector<std::string> violations;
};

/// Static checks run before any guest code executes. Parsing goes through the
/// embedded interpreter, so `validate` requires a started runtime and the GIL.
class CodeValidator {
public:
  explicit CodeValidator(const PolicySet &policy = default_policy());

  [[nodiscard]] ValidationOutcome validate(const std::string &code) const;

private:
  const PolicySet &policy_;
};

} // namespace codebox::security
