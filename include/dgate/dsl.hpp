#pragma once

// dgate/dsl.hpp — Author-facing text syntax for requirement trees.
//
// Grammar (precedence ! > && > ||):
//   expr    := or
//   or      := and ( ("||" | "or") and )*
//   and     := unary ( ("&&" | "and") unary )*
//   unary   := ("!" | "not") unary | primary
//   primary := "(" expr ")" | call | IDENT
//   call    := ("all" | "any") "(" expr ("," expr)* ")"
//            | ("at_least" | "require_group") "(" NUMBER "," expr ("," expr)* ")"
//            | IDENT "(" ")"                      -- zero-arg form of a condition
//
// Input is untrusted: size and nesting are bounded and every error carries the
// byte offset where parsing stopped. Unknown condition ids are not detected
// here; validate_requirement() checks leaves against the spec.

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "dgate/requirement.hpp"
#include "dgate/types.hpp"

namespace dgate {

struct DslLimits {
  std::size_t max_input_bytes{64 * 1024};
  std::size_t max_nesting{32};
};

std::optional<RequirementNode> parse_requirement_dsl(std::string_view text, GateError* err,
                                                     const DslLimits& limits = {});

// Function-call rendering, e.g. all(a, any(b, not(c)), at_least(2, d, e, f)).
// Round-trips through parse_requirement_dsl() unless a condition id is a
// keyword (and, or, not) or all digits.
std::string requirement_to_dsl(const RequirementNode& node);

}  // namespace dgate
