#include "dgate/decimal.hpp"

#include <algorithm>

namespace dgate {

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

// Magnitude comparison of two coefficients at a common scale.
// Leading zeros are ignored, so a padded zero ("000") compares as zero.
int compare_aligned(const std::string& a, const std::string& b) {
  std::size_t ia = a.find_first_not_of('0');
  std::size_t ib = b.find_first_not_of('0');
  if (ia == std::string::npos) ia = a.size();
  if (ib == std::string::npos) ib = b.size();
  const std::size_t la = a.size() - ia;
  const std::size_t lb = b.size() - ib;
  if (la != lb) return la < lb ? -1 : 1;
  const int c = a.compare(ia, la, b, ib, lb);
  return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

std::string pad_scale(const std::string& digits, std::size_t from, std::size_t to) {
  return to > from ? digits + std::string(to - from, '0') : digits;
}

std::string add_magnitudes(const std::string& a, const std::string& b) {
  std::string out;
  out.reserve(std::max(a.size(), b.size()) + 1);
  int carry = 0;
  std::size_t i = a.size(), j = b.size();
  while (i > 0 || j > 0 || carry) {
    int sum = carry;
    if (i > 0) sum += a[--i] - '0';
    if (j > 0) sum += b[--j] - '0';
    out.push_back(static_cast<char>('0' + sum % 10));
    carry = sum / 10;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

// Requires a >= b.
std::string sub_magnitudes(const std::string& a, const std::string& b) {
  std::string out;
  out.reserve(a.size());
  int borrow = 0;
  std::size_t i = a.size(), j = b.size();
  while (i > 0) {
    int d = (a[--i] - '0') - borrow;
    if (j > 0) d -= b[--j] - '0';
    if (d < 0) { d += 10; borrow = 1; } else { borrow = 0; }
    out.push_back(static_cast<char>('0' + d));
  }
  std::reverse(out.begin(), out.end());
  return out;
}

}  // namespace

Decimal::Decimal(bool negative, std::string digits, std::size_t scale)
    : negative_(negative), digits_(std::move(digits)), scale_(scale) {
  normalize();
}

void Decimal::normalize() {
  const auto first = digits_.find_first_not_of('0');
  if (first == std::string::npos) {
    digits_ = "0";
    scale_ = 0;
    negative_ = false;
    return;
  }
  digits_.erase(0, first);
  while (scale_ > 0 && digits_.back() == '0') {
    digits_.pop_back();
    --scale_;
  }
}

std::optional<Decimal> Decimal::parse(std::string_view text) {
  std::size_t i = 0;
  bool negative = false;
  if (i < text.size() && text[i] == '-') { negative = true; ++i; }
  if (i >= text.size() || !is_digit(text[i])) return std::nullopt;
  if (text[i] == '0' && i + 1 < text.size() && is_digit(text[i + 1])) return std::nullopt;

  std::string digits;
  while (i < text.size() && is_digit(text[i])) digits.push_back(text[i++]);
  std::size_t frac_len = 0;
  if (i < text.size() && text[i] == '.') {
    ++i;
    if (i >= text.size() || !is_digit(text[i])) return std::nullopt;
    while (i < text.size() && is_digit(text[i])) { digits.push_back(text[i++]); ++frac_len; }
  }
  long long exponent = 0;
  if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
    ++i;
    bool exp_negative = false;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) exp_negative = text[i++] == '-';
    if (i >= text.size() || !is_digit(text[i])) return std::nullopt;
    std::size_t exp_digits = 0;
    while (i < text.size() && is_digit(text[i])) {
      if (++exp_digits > 7) return std::nullopt;
      exponent = exponent * 10 + (text[i++] - '0');
    }
    if (exp_negative) exponent = -exponent;
  }
  if (i != text.size()) return std::nullopt;
  if (digits.size() > kMaxDigits) return std::nullopt;

  // scale = frac_len - exponent; a negative scale becomes trailing zeros.
  const long long scale = static_cast<long long>(frac_len) - exponent;
  if (scale < 0) {
    const auto zeros = static_cast<std::size_t>(-scale);
    if (digits.size() + zeros > kMaxDigits) {
      // Only representable when the coefficient is zero.
      if (digits.find_first_not_of('0') != std::string::npos) return std::nullopt;
      return Decimal{};
    }
    digits.append(zeros, '0');
    return Decimal(negative, std::move(digits), 0);
  }
  if (static_cast<unsigned long long>(scale) > kMaxDigits) {
    if (digits.find_first_not_of('0') != std::string::npos) return std::nullopt;
    return Decimal{};
  }
  return Decimal(negative, std::move(digits), static_cast<std::size_t>(scale));
}

Decimal Decimal::from_int(long long value) {
  const bool negative = value < 0;
  // Avoid overflow on LLONG_MIN by working in unsigned space.
  unsigned long long mag = negative ? 0ULL - static_cast<unsigned long long>(value)
                                    : static_cast<unsigned long long>(value);
  return Decimal(negative, std::to_string(mag), 0);
}

std::string Decimal::to_string() const {
  std::string out;
  if (negative_) out.push_back('-');
  if (scale_ == 0) return out + digits_;
  if (digits_.size() > scale_) {
    out += digits_.substr(0, digits_.size() - scale_);
    out.push_back('.');
    out += digits_.substr(digits_.size() - scale_);
  } else {
    out += "0.";
    out.append(scale_ - digits_.size(), '0');
    out += digits_;
  }
  return out;
}

int Decimal::compare(const Decimal& other) const {
  if (negative_ != other.negative_) return negative_ ? -1 : 1;
  const std::size_t scale = std::max(scale_, other.scale_);
  const int mag = compare_aligned(pad_scale(digits_, scale_, scale),
                                  pad_scale(other.digits_, other.scale_, scale));
  return negative_ ? -mag : mag;
}

Decimal Decimal::negated() const {
  if (is_zero()) return *this;
  return Decimal(!negative_, digits_, scale_);
}

Decimal Decimal::operator+(const Decimal& other) const {
  const std::size_t scale = std::max(scale_, other.scale_);
  const std::string a = pad_scale(digits_, scale_, scale);
  const std::string b = pad_scale(other.digits_, other.scale_, scale);
  if (negative_ == other.negative_) {
    return Decimal(negative_, add_magnitudes(a, b), scale);
  }
  const int mag = compare_aligned(a, b);
  if (mag == 0) return Decimal{};
  if (mag > 0) return Decimal(negative_, sub_magnitudes(a, b), scale);
  return Decimal(other.negative_, sub_magnitudes(b, a), scale);
}

Decimal Decimal::operator-(const Decimal& other) const { return *this + other.negated(); }

}  // namespace dgate
