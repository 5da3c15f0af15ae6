#include "dgate/comparator.hpp"

#include <array>
#include <utility>
#include <vector>

namespace dgate {

namespace {

struct OpName {
  ComparatorOp op;
  std::string_view name;
};

constexpr std::array<OpName, 14> kOpNames = {{
    {ComparatorOp::equals, "equals"},
    {ComparatorOp::not_equals, "not_equals"},
    {ComparatorOp::greater_than, "greater_than"},
    {ComparatorOp::greater_than_or_equal, "greater_than_or_equal"},
    {ComparatorOp::less_than, "less_than"},
    {ComparatorOp::less_than_or_equal, "less_than_or_equal"},
    {ComparatorOp::lex_greater_than, "lex_greater_than"},
    {ComparatorOp::lex_greater_than_or_equal, "lex_greater_than_or_equal"},
    {ComparatorOp::lex_less_than, "lex_less_than"},
    {ComparatorOp::lex_less_than_or_equal, "lex_less_than_or_equal"},
    {ComparatorOp::contains, "contains"},
    {ComparatorOp::in_set, "in_set"},
    {ComparatorOp::deep_equals, "deep_equals"},
    {ComparatorOp::deep_not_equals, "deep_not_equals"},
}};

bool digits_at(std::string_view s, std::size_t pos, std::size_t count, int* out) {
  if (pos + count > s.size()) return false;
  int v = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (s[i] < '0' || s[i] > '9') return false;
    v = v * 10 + (s[i] - '0');
  }
  *out = v;
  return true;
}

bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int days_in_month(int y, int m) {
  static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return m == 2 && is_leap(y) ? 29 : kDays[m - 1];
}

// Days since 1970-01-01 in the proleptic Gregorian calendar.
std::int64_t days_from_civil(int y, int m, int d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * static_cast<unsigned>(m + (m > 2 ? -3 : 9)) + 2) / 5 +
                       static_cast<unsigned>(d) - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

// -1, 0, 1 ordering of two fractional digit strings.
int compare_fraction(const std::string& a, const std::string& b) {
  const std::size_t n = a.size() > b.size() ? a.size() : b.size();
  for (std::size_t i = 0; i < n; ++i) {
    const char ca = i < a.size() ? a[i] : '0';
    const char cb = i < b.size() ? b[i] : '0';
    if (ca != cb) return ca < cb ? -1 : 1;
  }
  return 0;
}

TriState from_ordering(ComparatorOp op, int c) {
  switch (op) {
    case ComparatorOp::greater_than:
    case ComparatorOp::lex_greater_than:
      return tri_from_bool(c > 0);
    case ComparatorOp::greater_than_or_equal:
    case ComparatorOp::lex_greater_than_or_equal:
      return tri_from_bool(c >= 0);
    case ComparatorOp::less_than:
    case ComparatorOp::lex_less_than:
      return tri_from_bool(c < 0);
    case ComparatorOp::less_than_or_equal:
    case ComparatorOp::lex_less_than_or_equal:
      return tri_from_bool(c <= 0);
    default:
      return TriState::Indeterminate;
  }
}

TriState compare_ordering(ComparatorOp op, const EvidenceValue& actual,
                          const EvidenceValue& expected) {
  if (actual.kind() == EvidenceValue::Kind::number &&
      expected.kind() == EvidenceValue::Kind::number) {
    return from_ordering(op, std::get<Decimal>(actual.v).compare(std::get<Decimal>(expected.v)));
  }
  if (actual.kind() == EvidenceValue::Kind::text &&
      expected.kind() == EvidenceValue::Kind::text) {
    const auto a = parse_rfc3339(std::get<std::string>(actual.v));
    const auto b = parse_rfc3339(std::get<std::string>(expected.v));
    if (!a || !b || a->date_only != b->date_only) return TriState::Indeterminate;
    return from_ordering(op, compare_temporal(*a, *b));
  }
  return TriState::Indeterminate;
}

TriState compare_lex(ComparatorOp op, const EvidenceValue& actual, const EvidenceValue& expected) {
  if (actual.kind() != EvidenceValue::Kind::text ||
      expected.kind() != EvidenceValue::Kind::text) {
    return TriState::Indeterminate;
  }
  const int c = std::get<std::string>(actual.v).compare(std::get<std::string>(expected.v));
  return from_ordering(op, c < 0 ? -1 : (c > 0 ? 1 : 0));
}

TriState compare_scalar_equality(const EvidenceValue& actual, const EvidenceValue& expected) {
  if (actual.kind() != expected.kind()) return TriState::Indeterminate;
  if (actual.kind() == EvidenceValue::Kind::list) return TriState::Indeterminate;
  return tri_from_bool(values_equal(actual, expected));
}

TriState compare_contains(const EvidenceValue& actual, const EvidenceValue& expected) {
  if (actual.kind() == EvidenceValue::Kind::text &&
      expected.kind() == EvidenceValue::Kind::text) {
    return tri_from_bool(std::get<std::string>(actual.v).find(std::get<std::string>(expected.v)) !=
                         std::string::npos);
  }
  if (actual.kind() != EvidenceValue::Kind::list) return TriState::Indeterminate;
  const auto& haystack = std::get<std::vector<EvidenceValue>>(actual.v);
  auto has = [&haystack](const EvidenceValue& needle) {
    for (const auto& item : haystack) {
      if (values_equal(item, needle)) return true;
    }
    return false;
  };
  // List expected: superset check. Scalar expected: membership.
  if (expected.kind() == EvidenceValue::Kind::list) {
    for (const auto& needle : std::get<std::vector<EvidenceValue>>(expected.v)) {
      if (!has(needle)) return TriState::False;
    }
    return TriState::True;
  }
  return tri_from_bool(has(expected));
}

TriState compare_in_set(const EvidenceValue& actual, const EvidenceValue& expected) {
  if (expected.kind() != EvidenceValue::Kind::list) return TriState::Indeterminate;
  if (actual.kind() == EvidenceValue::Kind::list) return TriState::Indeterminate;
  for (const auto& item : std::get<std::vector<EvidenceValue>>(expected.v)) {
    if (values_equal(actual, item)) return TriState::True;
  }
  return TriState::False;
}

}  // namespace

std::string to_string(ComparatorOp op) {
  for (const auto& entry : kOpNames) {
    if (entry.op == op) return std::string(entry.name);
  }
  return "";
}

std::optional<ComparatorOp> comparator_op_from_string(std::string_view name) {
  for (const auto& entry : kOpNames) {
    if (entry.name == name) return entry.op;
  }
  return std::nullopt;
}

OperatorTable OperatorTable::standard() {
  OperatorTable t;
  for (const auto& entry : kOpNames) t.enabled.insert(entry.op);
  return t;
}

std::optional<TemporalPoint> parse_rfc3339(std::string_view s) {
  int year = 0, month = 0, day = 0;
  if (s.size() < 10 || !digits_at(s, 0, 4, &year) || s[4] != '-' ||
      !digits_at(s, 5, 2, &month) || s[7] != '-' || !digits_at(s, 8, 2, &day)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
    return std::nullopt;
  }
  TemporalPoint point;
  const std::int64_t days = days_from_civil(year, month, day);
  if (s.size() == 10) {
    point.date_only = true;
    point.seconds = days * 86400;
    return point;
  }

  int hour = 0, minute = 0, second = 0;
  if (s.size() < 20 || (s[10] != 'T' && s[10] != 't') || !digits_at(s, 11, 2, &hour) ||
      s[13] != ':' || !digits_at(s, 14, 2, &minute) || s[16] != ':' ||
      !digits_at(s, 17, 2, &second)) {
    return std::nullopt;
  }
  // Second 60 is a leap second.
  if (hour > 23 || minute > 59 || second > 60) return std::nullopt;

  std::size_t pos = 19;
  if (s[pos] == '.') {
    ++pos;
    const std::size_t start = pos;
    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') ++pos;
    if (pos == start) return std::nullopt;
    point.fraction = std::string(s.substr(start, pos - start));
    while (!point.fraction.empty() && point.fraction.back() == '0') point.fraction.pop_back();
  }
  if (pos >= s.size()) return std::nullopt;

  std::int64_t offset_seconds = 0;
  if (s[pos] == 'Z' || s[pos] == 'z') {
    ++pos;
  } else if (s[pos] == '+' || s[pos] == '-') {
    int oh = 0, om = 0;
    if (pos + 6 != s.size() || !digits_at(s, pos + 1, 2, &oh) || s[pos + 3] != ':' ||
        !digits_at(s, pos + 4, 2, &om) || oh > 23 || om > 59) {
      return std::nullopt;
    }
    offset_seconds = (oh * 3600 + om * 60) * (s[pos] == '-' ? -1 : 1);
    pos += 6;
  } else {
    return std::nullopt;
  }
  if (pos != s.size()) return std::nullopt;

  point.seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;
  return point;
}

int compare_temporal(const TemporalPoint& a, const TemporalPoint& b) {
  if (a.seconds != b.seconds) return a.seconds < b.seconds ? -1 : 1;
  return compare_fraction(a.fraction, b.fraction);
}

bool values_equal(const EvidenceValue& a, const EvidenceValue& b) {
  if (a.kind() != b.kind()) return false;
  switch (a.kind()) {
    case EvidenceValue::Kind::missing:
      return true;
    case EvidenceValue::Kind::boolean:
      return std::get<bool>(a.v) == std::get<bool>(b.v);
    case EvidenceValue::Kind::number:
      return std::get<Decimal>(a.v) == std::get<Decimal>(b.v);
    case EvidenceValue::Kind::text:
      return std::get<std::string>(a.v) == std::get<std::string>(b.v);
    case EvidenceValue::Kind::list: {
      const auto& la = std::get<std::vector<EvidenceValue>>(a.v);
      const auto& lb = std::get<std::vector<EvidenceValue>>(b.v);
      if (la.size() != lb.size()) return false;
      for (std::size_t i = 0; i < la.size(); ++i) {
        if (!values_equal(la[i], lb[i])) return false;
      }
      return true;
    }
  }
  return false;
}

Comparator::Comparator(OperatorTable table) : table_(std::move(table)) {}

TriState Comparator::compare(ComparatorOp op, const EvidenceValue& actual,
                             const EvidenceValue& expected) const {
  if (!table_.allows(op)) return TriState::Indeterminate;
  if (actual.is_missing() || expected.is_missing()) return TriState::Indeterminate;

  switch (op) {
    case ComparatorOp::equals:
      return compare_scalar_equality(actual, expected);
    case ComparatorOp::not_equals: {
      const TriState eq = compare_scalar_equality(actual, expected);
      if (eq == TriState::Indeterminate) return eq;
      return eq == TriState::True ? TriState::False : TriState::True;
    }
    case ComparatorOp::greater_than:
    case ComparatorOp::greater_than_or_equal:
    case ComparatorOp::less_than:
    case ComparatorOp::less_than_or_equal:
      return compare_ordering(op, actual, expected);
    case ComparatorOp::lex_greater_than:
    case ComparatorOp::lex_greater_than_or_equal:
    case ComparatorOp::lex_less_than:
    case ComparatorOp::lex_less_than_or_equal:
      return compare_lex(op, actual, expected);
    case ComparatorOp::contains:
      return compare_contains(actual, expected);
    case ComparatorOp::in_set:
      return compare_in_set(actual, expected);
    case ComparatorOp::deep_equals:
    case ComparatorOp::deep_not_equals: {
      if (actual.kind() != expected.kind()) return TriState::Indeterminate;
      const bool eq = values_equal(actual, expected);
      return tri_from_bool(op == ComparatorOp::deep_equals ? eq : !eq);
    }
  }
  return TriState::Indeterminate;
}

TriState compare(ComparatorOp op, const EvidenceValue& actual, const EvidenceValue& expected) {
  static const Comparator kStandard;
  return kStandard.compare(op, actual, expected);
}

}  // namespace dgate
