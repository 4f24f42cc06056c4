#include "Amount.h"

#include <cmath>
#include <limits>

namespace payproc {

Amount::Amount() : units_(0), negative_(false) {}

Amount::Amount(int64_t units, bool negative)
    : units_(units), negative_(negative) {}

Amount Amount::fromUnits(int64_t units) { return Amount(units, units < 0); }

Amount::Roe<Amount> Amount::parse(const std::string &text) {
  if (text.empty()) {
    return Error(E_FORMAT, "empty amount");
  }

  size_t pos = 0;
  bool negative = false;
  if (text[pos] == '+' || text[pos] == '-') {
    negative = text[pos] == '-';
    ++pos;
  }

  const int64_t maxUnits = std::numeric_limits<int64_t>::max();
  int64_t whole = 0;
  size_t wholeDigits = 0;
  while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
    int digit = text[pos] - '0';
    if (whole > (maxUnits / UNITS_PER_WHOLE - digit) / 10) {
      return Error(E_RANGE, "amount out of range: " + text);
    }
    whole = whole * 10 + digit;
    ++wholeDigits;
    ++pos;
  }

  int64_t fraction = 0;
  size_t fractionDigits = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      int digit = text[pos] - '0';
      if (fractionDigits < static_cast<size_t>(SCALE)) {
        fraction = fraction * 10 + digit;
      } else if (digit != 0) {
        return Error(E_PRECISION, "amount has more than " +
                                      std::to_string(SCALE) +
                                      " decimal places: " + text);
      }
      ++fractionDigits;
      ++pos;
    }
  }

  if (pos != text.size() || (wholeDigits == 0 && fractionDigits == 0)) {
    return Error(E_FORMAT, "invalid amount: " + text);
  }

  for (size_t i = fractionDigits; i < static_cast<size_t>(SCALE); ++i) {
    fraction *= 10;
  }
  if (whole == maxUnits / UNITS_PER_WHOLE &&
      fraction > maxUnits % UNITS_PER_WHOLE) {
    return Error(E_RANGE, "amount out of range: " + text);
  }

  int64_t units = whole * UNITS_PER_WHOLE + fraction;
  return Amount(negative ? -units : units, negative);
}

bool Amount::isValidQuantity(double value) {
  if (value == 0.0) {
    return !std::signbit(value);
  }
  return std::isnormal(value) && value > 0.0;
}

Amount::Roe<Amount> Amount::fromDouble(double value) {
  if (!isValidQuantity(value)) {
    return Error(E_VALUE, "not a valid quantity: " + std::to_string(value));
  }
  double scaled = value * static_cast<double>(UNITS_PER_WHOLE);
  // 2^63 is the first double past the int64 range
  if (scaled >= 9223372036854775808.0) {
    return Error(E_RANGE, "amount out of range: " + std::to_string(value));
  }
  return fromUnits(std::llround(scaled));
}

bool Amount::canAdd(const Amount &other) const {
  const int64_t max = std::numeric_limits<int64_t>::max();
  const int64_t min = std::numeric_limits<int64_t>::min();
  if (other.units_ > 0) {
    return units_ <= max - other.units_;
  }
  return units_ >= min - other.units_;
}

bool Amount::canSubtract(const Amount &other) const {
  const int64_t max = std::numeric_limits<int64_t>::max();
  const int64_t min = std::numeric_limits<int64_t>::min();
  if (other.units_ > 0) {
    return units_ >= min + other.units_;
  }
  return units_ <= max + other.units_;
}

Amount Amount::operator+(const Amount &other) const {
  return fromUnits(units_ + other.units_);
}

Amount Amount::operator-(const Amount &other) const {
  return fromUnits(units_ - other.units_);
}

Amount &Amount::operator+=(const Amount &other) {
  *this = *this + other;
  return *this;
}

Amount &Amount::operator-=(const Amount &other) {
  *this = *this - other;
  return *this;
}

std::string Amount::toString() const {
  uint64_t magnitude = units_ < 0 ? 0 - static_cast<uint64_t>(units_)
                                  : static_cast<uint64_t>(units_);
  uint64_t whole = magnitude / UNITS_PER_WHOLE;
  uint64_t fraction = magnitude % UNITS_PER_WHOLE;

  std::string digits = std::to_string(fraction);
  digits.insert(0, SCALE - digits.size(), '0');
  while (digits.size() > 1 && digits.back() == '0') {
    digits.pop_back();
  }

  std::string result = negative_ ? "-" : "";
  result += std::to_string(whole);
  result += '.';
  result += digits;
  return result;
}

std::ostream &operator<<(std::ostream &os, const Amount &amount) {
  return os << amount.toString();
}

} // namespace payproc
