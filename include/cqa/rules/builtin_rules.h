#pragma once

#include "cqa/rules/rule.h"

#include <vector>

namespace cqa::rules {

// Built-in rule families, one factory per category. Each returns its rules in
// registration order.

// STR-001..STR-006: function length, nesting, class size, complexity, duplication.
[[nodiscard]] std::vector<Rule> structure_rules();

// ERR-001..ERR-004: catch-all handlers, swallowed exceptions, unguarded I/O, cleanup.
[[nodiscard]] std::vector<Rule> error_handling_rules();

// PRF-001..PRF-003: accumulation loops, quadratic loops, string building in loops.
[[nodiscard]] std::vector<Rule> performance_rules();

// SEC-001..SEC-004: secrets, dynamic code execution, path concatenation, shell commands.
[[nodiscard]] std::vector<Rule> security_rules();

// MNT-001..MNT-004: docstrings, type hints, naming.
[[nodiscard]] std::vector<Rule> maintainability_rules();

// BP-001..BP-004: print output, line length, wildcard imports, mutable defaults.
[[nodiscard]] std::vector<Rule> best_practice_rules();

}  // namespace cqa::rules
