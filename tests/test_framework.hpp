#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace codebox::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

inline void require(bool condition, const std::string &message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

/// Fails with the whole haystack in the message, which is what you want to see
/// when captured interpreter output does not look as expected.
inline void require_contains(const std::string &haystack, const std::string &needle) {
  if (haystack.find(needle) == std::string::npos) {
    throw std::runtime_error("expected '" + needle + "' in: " + haystack);
  }
}

} // namespace codebox::tests
