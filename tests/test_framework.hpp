#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hooktunnel::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

inline void require(bool condition, const std::string &message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

/// Console and log assertions: fails with the captured text so mismatches are readable.
inline void require_contains(const std::string &text, const std::string &needle,
                             const std::string &message) {
  if (text.find(needle) == std::string::npos) {
    throw std::runtime_error(message + ": expected '" + needle + "' in '" + text + "'");
  }
}

} // namespace hooktunnel::tests
