#ifndef PAYPROC_AMOUNT_H
#define PAYPROC_AMOUNT_H

#include "../lib/ResultOrError.h"

#include <cstdint>
#include <ostream>
#include <string>

namespace payproc {

/**
 * Amount - Exact fixed-point decimal with four fractional digits.
 *
 * The value is held as a signed count of 1/10000 units. The sign is kept as
 * written, so a parsed "-0.0" reports isNegative() even though it compares
 * equal to zero. Results of arithmetic carry the sign of their value.
 */
class Amount {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_FORMAT = 1;
  constexpr static int32_t E_PRECISION = 2;
  constexpr static int32_t E_RANGE = 3;
  constexpr static int32_t E_VALUE = 4;

  constexpr static int32_t SCALE = 4;
  constexpr static int64_t UNITS_PER_WHOLE = 10000;

  Amount();

  static Amount fromUnits(int64_t units);

  /**
   * Parse a plain decimal: optional sign, digits, optional '.' and up to
   * SCALE fractional digits (further digits must be zeros).
   */
  static Roe<Amount> parse(const std::string &text);

  /**
   * Convert a floating-point quantity. Only values accepted by
   * isValidQuantity() convert; the result is rounded to SCALE digits.
   */
  static Roe<Amount> fromDouble(double value);

  /**
   * True iff the value is +0.0, or strictly positive, finite and normal.
   * Rejects -0.0, negatives, subnormals, infinities and NaN.
   */
  static bool isValidQuantity(double value);

  int64_t getUnits() const { return units_; }
  bool isNegative() const { return negative_; }
  bool isZero() const { return units_ == 0; }

  // Overflow checks for the 64-bit unit count
  bool canAdd(const Amount &other) const;
  bool canSubtract(const Amount &other) const;

  Amount operator+(const Amount &other) const;
  Amount operator-(const Amount &other) const;
  Amount &operator+=(const Amount &other);
  Amount &operator-=(const Amount &other);

  bool operator==(const Amount &other) const { return units_ == other.units_; }
  bool operator!=(const Amount &other) const { return units_ != other.units_; }
  bool operator<(const Amount &other) const { return units_ < other.units_; }
  bool operator<=(const Amount &other) const { return units_ <= other.units_; }
  bool operator>(const Amount &other) const { return units_ > other.units_; }
  bool operator>=(const Amount &other) const { return units_ >= other.units_; }

  // "51.0", "0.0", "1.2345", "-3.5"; a parsed "-0.0" keeps its sign
  std::string toString() const;

private:
  Amount(int64_t units, bool negative);

  int64_t units_;
  bool negative_;
};

std::ostream &operator<<(std::ostream &os, const Amount &amount);

} // namespace payproc

#endif // PAYPROC_AMOUNT_H
