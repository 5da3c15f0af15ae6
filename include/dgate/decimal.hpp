#pragma once

// dgate/decimal.hpp — Exact, arbitrary-precision signed decimal.
//
// Representation: value = (-1)^negative * coefficient * 10^-scale, where the
// coefficient is a string of decimal digits without leading zeros and the
// scale is normalized so the last fractional digit is non-zero. Zero is always
// non-negative with scale 0. Every value therefore has exactly one canonical
// representation, and equality is structural.
//
// No operation in this type touches binary floating point.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dgate {

class Decimal {
 public:
  // Upper bound on coefficient digits after exponent expansion. Inputs that
  // would exceed it are rejected by parse() instead of allocating.
  static constexpr std::size_t kMaxDigits = 4096;

  Decimal() = default;

  // Accepts the JSON number grammar: -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
  static std::optional<Decimal> parse(std::string_view text);
  static Decimal from_int(long long value);

  // Canonical text: no exponent, no leading zeros, no trailing fractional zeros.
  std::string to_string() const;

  bool is_zero() const { return digits_ == "0"; }
  bool negative() const { return negative_; }
  std::size_t scale() const { return scale_; }

  // -1, 0, 1
  int compare(const Decimal& other) const;

  Decimal negated() const;
  Decimal operator+(const Decimal& other) const;
  Decimal operator-(const Decimal& other) const;

  bool operator==(const Decimal& o) const {
    return negative_ == o.negative_ && scale_ == o.scale_ && digits_ == o.digits_;
  }
  bool operator!=(const Decimal& o) const { return !(*this == o); }
  bool operator<(const Decimal& o) const { return compare(o) < 0; }
  bool operator<=(const Decimal& o) const { return compare(o) <= 0; }
  bool operator>(const Decimal& o) const { return compare(o) > 0; }
  bool operator>=(const Decimal& o) const { return compare(o) >= 0; }

 private:
  Decimal(bool negative, std::string digits, std::size_t scale);
  void normalize();

  bool negative_{false};
  std::string digits_{"0"};
  std::size_t scale_{0};
};

}  // namespace dgate
