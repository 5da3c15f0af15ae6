#pragma once

// dgate/comparator.hpp — Tri-state typed comparison of evidence values.
//
// DESIGN INVARIANTS:
//   1. compare() is total and pure. It never throws, never allocates shared
//      state and returns the same answer for the same inputs forever.
//   2. A Missing operand on either side yields Indeterminate for every
//      operator. Missing evidence is never coerced to false.
//   3. Operands of incompatible kinds yield Indeterminate. There is no
//      implicit conversion between numbers, strings and booleans.
//   4. Numbers compare exactly (Decimal). 0.1 + 0.2 == 0.3 holds.
//
// Ordering operators (greater_than .. less_than_or_equal) accept two numbers,
// or two strings that both parse as RFC 3339 timestamps of the same shape
// (both date-only or both date-time). Any other pairing is Indeterminate.
//
// EXTENSION_POINT: operator_table
//   OperatorTable controls which operators a deployment accepts. Spec
//   validation rejects conditions whose operator is not enabled, so a
//   disabled operator can never reach compare().

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "dgate/types.hpp"

namespace dgate {

enum class ComparatorOp {
  equals,
  not_equals,
  greater_than,
  greater_than_or_equal,
  less_than,
  less_than_or_equal,
  lex_greater_than,
  lex_greater_than_or_equal,
  lex_less_than,
  lex_less_than_or_equal,
  contains,
  in_set,
  deep_equals,
  deep_not_equals,
};

std::string to_string(ComparatorOp op);
std::optional<ComparatorOp> comparator_op_from_string(std::string_view name);

struct OperatorTable {
  std::set<ComparatorOp> enabled;

  // Every operator above.
  static OperatorTable standard();
  bool allows(ComparatorOp op) const { return enabled.count(op) != 0; }
};

// RFC 3339 instant or full-date, normalized to UTC.
struct TemporalPoint {
  bool date_only{false};
  std::int64_t seconds{0};  // since 1970-01-01T00:00:00Z (date-only: midnight)
  std::string fraction;     // fractional-second digits, trailing zeros stripped
};

std::optional<TemporalPoint> parse_rfc3339(std::string_view text);
// -1, 0, 1. Callers must only compare points of the same shape.
int compare_temporal(const TemporalPoint& a, const TemporalPoint& b);

// Structural equality. Numbers compare by value, lists element-wise.
bool values_equal(const EvidenceValue& a, const EvidenceValue& b);

class Comparator {
 public:
  explicit Comparator(OperatorTable table = OperatorTable::standard());

  // Indeterminate for operators the table does not enable.
  TriState compare(ComparatorOp op, const EvidenceValue& actual,
                   const EvidenceValue& expected) const;

  const OperatorTable& table() const { return table_; }

 private:
  OperatorTable table_;
};

// Convenience over the standard table.
TriState compare(ComparatorOp op, const EvidenceValue& actual, const EvidenceValue& expected);

}  // namespace dgate
