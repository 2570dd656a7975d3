#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace txcore {
namespace common {

// Fixed-point monetary value counted in 1/10,000 units.
// Arithmetic throws std::overflow_error instead of wrapping or clamping.
class Amount {
 public:
  static constexpr std::int64_t kScale = 10'000;
  static constexpr int kDecimals = 4;

  constexpr Amount() noexcept = default;

  static constexpr Amount from_units(std::int64_t units) noexcept { return Amount{units}; }

  // Digits past the fourth decimal are rounded half away from zero.
  // Returns std::nullopt for malformed or out-of-range text.
  static std::optional<Amount> from_decimal_text(std::string_view text);

  [[nodiscard]] std::string to_decimal_text() const;

  [[nodiscard]] constexpr std::int64_t units() const noexcept { return units_; }
  [[nodiscard]] constexpr bool is_negative() const noexcept { return units_ < 0; }
  [[nodiscard]] constexpr bool is_positive() const noexcept { return units_ > 0; }
  [[nodiscard]] constexpr bool is_zero() const noexcept { return units_ == 0; }

  [[nodiscard]] Amount add(Amount other) const;
  [[nodiscard]] Amount sub(Amount other) const;

  Amount operator+(Amount other) const { return add(other); }
  Amount operator-(Amount other) const { return sub(other); }
  Amount& operator+=(Amount other);
  Amount& operator-=(Amount other);

  constexpr auto operator<=>(const Amount&) const noexcept = default;

 private:
  constexpr explicit Amount(std::int64_t units) noexcept : units_(units) {}

  std::int64_t units_{0};
};

}  // namespace common
}  // namespace txcore
