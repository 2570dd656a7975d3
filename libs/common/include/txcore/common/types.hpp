#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "txcore/common/amount.hpp"

namespace txcore {
namespace common {

using ClientId = std::uint64_t;
using TxId = std::uint64_t;

enum class RecordKind : std::uint8_t {
  kDeposit,
  kWithdrawal,
  kDispute,
  kResolve,
  kChargeback,
};

inline constexpr std::size_t kRecordKindCount = 5;

// Deposit and withdrawal carry an amount; the dispute family references an existing tx.
inline constexpr bool RequiresAmount(RecordKind kind) noexcept {
  return kind == RecordKind::kDeposit || kind == RecordKind::kWithdrawal;
}

[[nodiscard]] std::string_view to_string(RecordKind kind) noexcept;
[[nodiscard]] std::optional<RecordKind> parse_record_kind(std::string_view text) noexcept;

struct TransactionRecord {
  RecordKind kind{RecordKind::kDeposit};
  ClientId client{0};
  TxId tx{0};
  std::optional<Amount> amount{};
};

}  // namespace common
}  // namespace txcore
