#include "txcore/common/amount.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace txcore {
namespace common {

namespace {
constexpr std::uint64_t kMaxUnits = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
constexpr std::uint64_t kScaleUnsigned = static_cast<std::uint64_t>(Amount::kScale);

bool all_digits(std::string_view text) noexcept {
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

std::string_view trim(std::string_view text) noexcept {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

}  // namespace

std::optional<Amount> Amount::from_decimal_text(std::string_view text) {
  text = trim(text);
  if (text.empty()) {
    return std::nullopt;
  }

  bool negative = false;
  if (text.front() == '+' || text.front() == '-') {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  const auto dot = text.find('.');
  const std::string_view integral = text.substr(0, dot);
  const std::string_view fraction = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

  // A second '.' lands in `fraction` and fails the digit check.
  if ((integral.empty() && fraction.empty()) || !all_digits(integral) || !all_digits(fraction)) {
    return std::nullopt;
  }

  std::uint64_t whole = 0;
  for (const char c : integral) {
    const auto digit = static_cast<std::uint64_t>(c - '0');
    if (whole > (kMaxUnits - digit) / 10) {
      return std::nullopt;
    }
    whole = whole * 10 + digit;
  }
  if (whole > kMaxUnits / kScaleUnsigned) {
    return std::nullopt;
  }

  std::uint64_t frac_units = 0;
  for (int i = 0; i < kDecimals; ++i) {
    frac_units *= 10;
    if (static_cast<std::size_t>(i) < fraction.size()) {
      frac_units += static_cast<std::uint64_t>(fraction[static_cast<std::size_t>(i)] - '0');
    }
  }
  // Rounding works on the magnitude, so rounding up is away from zero for both signs.
  if (fraction.size() > static_cast<std::size_t>(kDecimals) && fraction[kDecimals] >= '5') {
    ++frac_units;
  }

  const std::uint64_t magnitude = whole * kScaleUnsigned;
  if (magnitude > kMaxUnits - frac_units) {
    return std::nullopt;
  }
  const auto units = static_cast<std::int64_t>(magnitude + frac_units);
  return Amount{negative ? -units : units};
}

std::string Amount::to_decimal_text() const {
  const std::uint64_t magnitude = units_ < 0 ? ~static_cast<std::uint64_t>(units_) + 1
                                             : static_cast<std::uint64_t>(units_);
  const std::string digits = std::to_string(magnitude % kScaleUnsigned);
  const std::string fraction = std::string(static_cast<std::size_t>(kDecimals) - digits.size(), '0') + digits;

  std::string out;
  if (units_ < 0) {
    out.push_back('-');
  }
  out += std::to_string(magnitude / kScaleUnsigned);
  out.push_back('.');
  out += fraction;
  return out;
}

Amount Amount::add(Amount other) const {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
  if ((other.units_ > 0 && units_ > kMax - other.units_) ||
      (other.units_ < 0 && units_ < kMin - other.units_)) {
    throw std::overflow_error("amount overflow in add: " + to_decimal_text() + " + " + other.to_decimal_text());
  }
  return Amount{units_ + other.units_};
}

Amount Amount::sub(Amount other) const {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
  if ((other.units_ < 0 && units_ > kMax + other.units_) ||
      (other.units_ > 0 && units_ < kMin + other.units_)) {
    throw std::overflow_error("amount overflow in sub: " + to_decimal_text() + " - " + other.to_decimal_text());
  }
  return Amount{units_ - other.units_};
}

Amount& Amount::operator+=(Amount other) {
  *this = add(other);
  return *this;
}

Amount& Amount::operator-=(Amount other) {
  *this = sub(other);
  return *this;
}

}  // namespace common
}  // namespace txcore
