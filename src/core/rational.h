// Exact rational arithmetic for beat positions and durations.

#ifndef TONELANG_CORE_RATIONAL_H
#define TONELANG_CORE_RATIONAL_H

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace tonelang {

/// @brief Reduced fraction of two 64-bit integers, used for beat values.
///
/// The denominator is always positive and gcd(numerator, denominator) == 1,
/// so two Rationals compare equal exactly when their fields match.
///
/// Intermediates are computed in 128 bits, so an operation is exact whenever
/// its reduced result fits in 64 bits. Parsed notation stays far inside that
/// range: every literal is a multiple of 10^-9 below 10^9 and the
/// parser bounds the length of each voice.
class Rational {
 public:
  constexpr Rational() = default;

  /// @brief Construct from an integer number of beats.
  constexpr Rational(int64_t whole) : num_(whole), den_(1) {}  // NOLINT(runtime/explicit)

  /// @brief Construct num/den and normalize. A zero denominator yields 0.
  Rational(int64_t num, int64_t den);

  int64_t numerator() const { return num_; }
  int64_t denominator() const { return den_; }

  bool isZero() const { return num_ == 0; }
  bool isPositive() const { return num_ > 0; }
  bool isInteger() const { return den_ == 1; }

  /// @brief Closest double value.
  double toDouble() const;

  /// @brief Fraction form, e.g. "3/2" or "2".
  std::string toString() const;

  /// Integer digits accepted by fromDecimalString (values below 10^9).
  static constexpr size_t kMaxIntegerDigits = 9;

  /// Fractional digits kept by fromDecimalString (resolution 10^-9).
  static constexpr size_t kMaxFractionDigits = 9;

  /// @brief Parse a decimal literal: "2", "0.5", ".25", "1.".
  ///
  /// Signs and exponents are not accepted. At most kMaxFractionDigits
  /// fractional digits are kept (the rest are truncated); the integer part
  /// may have at most kMaxIntegerDigits digits.
  /// @param text Literal text.
  /// @param out Parsed value (unchanged on failure).
  /// @return True if the whole text is a valid literal.
  static bool fromDecimalString(std::string_view text, Rational& out);

  Rational& operator+=(const Rational& rhs);
  Rational& operator-=(const Rational& rhs);
  Rational& operator*=(const Rational& rhs);

  friend Rational operator+(Rational lhs, const Rational& rhs) { return lhs += rhs; }
  friend Rational operator-(Rational lhs, const Rational& rhs) { return lhs -= rhs; }
  friend Rational operator*(Rational lhs, const Rational& rhs) { return lhs *= rhs; }

  friend bool operator==(const Rational& lhs, const Rational& rhs) {
    return lhs.num_ == rhs.num_ && lhs.den_ == rhs.den_;
  }
  friend bool operator!=(const Rational& lhs, const Rational& rhs) { return !(lhs == rhs); }
  friend bool operator<(const Rational& lhs, const Rational& rhs);
  friend bool operator>(const Rational& lhs, const Rational& rhs) { return rhs < lhs; }
  friend bool operator<=(const Rational& lhs, const Rational& rhs) { return !(rhs < lhs); }
  friend bool operator>=(const Rational& lhs, const Rational& rhs) { return !(lhs < rhs); }

 private:
  void normalize();

  /// Store a 128-bit fraction after reducing it (denominator must be nonzero).
  void assignWide(__int128 num, __int128 den);

  int64_t num_ = 0;
  int64_t den_ = 1;
};

/// @brief gtest / iostream printing ("3/2").
std::ostream& operator<<(std::ostream& os, const Rational& value);

}  // namespace tonelang

#endif  // TONELANG_CORE_RATIONAL_H
