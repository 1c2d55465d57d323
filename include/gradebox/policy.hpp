#pragma once

// gradebox/policy.hpp — Import allow-list checked before guest source runs.
//
// Source-level scan, line by line: `import a.b, c` and `from a.b import x`
// statements are matched at the start of a line (after indentation); lines
// starting with '#', '"""' or "'''" are skipped. Only the root package of
// each imported name is checked. This is a static pre-filter, not a
// sandbox: dynamic imports (__import__, importlib) are not seen.

#include <optional>
#include <string>
#include <string_view>

namespace gradebox {

struct PolicyViolation {
  std::string module;  // root package name as written ("" for relative imports)
  int line{0};         // 1-based
};

bool module_allowed(std::string_view root_module);

std::optional<PolicyViolation> find_policy_violation(const std::string& source_text);

// "Package policy violation: '<module>' not allowed"
std::string policy_violation_message(const PolicyViolation& v);

}  // namespace gradebox
