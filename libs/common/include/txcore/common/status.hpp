#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace txcore {
namespace common {

enum class Status : std::uint8_t {
  kOk,
  kInvalidAmount,
  kUnknownClient,
  kUnknownTransaction,
  kClientMismatch,
  kDuplicateTransactionId,
  kInsufficientFunds,
  kAccountLocked,
  kInvalidStateTransition,
};

inline constexpr std::size_t kStatusCount = 9;

inline constexpr bool Ok(Status status) noexcept {
  return status == Status::kOk;
}

[[nodiscard]] std::string_view to_string(Status status) noexcept;

}  // namespace common
}  // namespace txcore
