/// @file
/// @brief Rational beat arithmetic and decimal literal parsing.

#include "core/rational.h"

#include <cctype>
#include <numeric>
#include <ostream>

namespace tonelang {

namespace {

using Wide = __int128;

Wide wideGcd(Wide lhs, Wide rhs) {
  if (lhs < 0) lhs = -lhs;
  if (rhs < 0) rhs = -rhs;
  while (rhs != 0) {
    Wide rem = lhs % rhs;
    lhs = rhs;
    rhs = rem;
  }
  return lhs;
}

}  // namespace

Rational::Rational(int64_t num, int64_t den) : num_(num), den_(den) {
  normalize();
}

void Rational::normalize() {
  if (den_ == 0) {
    num_ = 0;
    den_ = 1;
    return;
  }
  if (den_ < 0) {
    num_ = -num_;
    den_ = -den_;
  }
  int64_t divisor = std::gcd(num_, den_);
  if (divisor > 1) {
    num_ /= divisor;
    den_ /= divisor;
  }
}

void Rational::assignWide(Wide num, Wide den) {
  if (den < 0) {
    num = -num;
    den = -den;
  }
  Wide divisor = wideGcd(num, den);
  if (divisor > 1) {
    num /= divisor;
    den /= divisor;
  }
  num_ = static_cast<int64_t>(num);
  den_ = static_cast<int64_t>(den);
}

double Rational::toDouble() const {
  return static_cast<double>(num_) / static_cast<double>(den_);
}

std::string Rational::toString() const {
  if (den_ == 1) return std::to_string(num_);
  return std::to_string(num_) + "/" + std::to_string(den_);
}

bool Rational::fromDecimalString(std::string_view text, Rational& out) {
  if (text.empty()) return false;

  size_t pos = 0;
  int64_t whole = 0;
  size_t int_digits = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    if (++int_digits > kMaxIntegerDigits) return false;
    whole = whole * 10 + (text[pos] - '0');
    ++pos;
  }

  int64_t frac = 0;
  int64_t scale = 1;
  size_t frac_digits = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      // Digits past the exact range are dropped (truncation).
      if (frac_digits < kMaxFractionDigits) {
        frac = frac * 10 + (text[pos] - '0');
        scale *= 10;
      }
      ++frac_digits;
      ++pos;
    }
  }

  if (pos != text.size()) return false;
  if (int_digits == 0 && frac_digits == 0) return false;  // "." alone

  out = Rational(whole * scale + frac, scale);
  return true;
}

Rational& Rational::operator+=(const Rational& rhs) {
  assignWide(static_cast<Wide>(num_) * rhs.den_ + static_cast<Wide>(rhs.num_) * den_,
             static_cast<Wide>(den_) * rhs.den_);
  return *this;
}

Rational& Rational::operator-=(const Rational& rhs) {
  assignWide(static_cast<Wide>(num_) * rhs.den_ - static_cast<Wide>(rhs.num_) * den_,
             static_cast<Wide>(den_) * rhs.den_);
  return *this;
}

Rational& Rational::operator*=(const Rational& rhs) {
  assignWide(static_cast<Wide>(num_) * rhs.num_, static_cast<Wide>(den_) * rhs.den_);
  return *this;
}

bool operator<(const Rational& lhs, const Rational& rhs) {
  return static_cast<Wide>(lhs.num_) * rhs.den_ < static_cast<Wide>(rhs.num_) * lhs.den_;
}

std::ostream& operator<<(std::ostream& os, const Rational& value) {
  return os << value.toString();
}

}  // namespace tonelang
