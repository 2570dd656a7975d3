#pragma once

#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include "txcore/common/amount.hpp"
#include "txcore/common/status.hpp"
#include "txcore/common/types.hpp"

namespace txcore {
namespace ledger {

// Clean -> Disputed -> {Resolved | ChargedBack}. Never moves backwards.
enum class DisputeState : std::uint8_t {
  kClean,
  kDisputed,
  kResolved,
  kChargedBack,
};

[[nodiscard]] std::string_view to_string(DisputeState state) noexcept;

struct LedgerEntry {
  common::TxId tx{0};
  common::ClientId client{0};
  common::Amount amount{};
  DisputeState state{DisputeState::kClean};
};

struct LedgerResult {
  common::Status status{common::Status::kOk};
  common::Amount amount{};
};

// Dispute-eligible deposits keyed by tx id, plus the ids of processed
// withdrawals so that tx ids stay unique across both kinds.
class LedgerState {
 public:
  [[nodiscard]] common::Status record_deposit(common::TxId tx, common::ClientId client, common::Amount amount);
  [[nodiscard]] common::Status record_withdrawal(common::TxId tx);

  [[nodiscard]] LedgerResult dispute(common::TxId tx, common::ClientId client);
  [[nodiscard]] LedgerResult resolve(common::TxId tx, common::ClientId client);
  [[nodiscard]] LedgerResult chargeback(common::TxId tx, common::ClientId client);

  [[nodiscard]] bool contains(common::TxId tx) const;
  [[nodiscard]] const LedgerEntry* find(common::TxId tx) const;
  [[nodiscard]] std::size_t deposit_count() const noexcept { return deposits_.size(); }

 private:
  std::unordered_map<common::TxId, LedgerEntry> deposits_{};
  std::unordered_set<common::TxId> withdrawals_{};

  LedgerResult transition(common::TxId tx, common::ClientId client, DisputeState from, DisputeState to);
};

}  // namespace ledger
}  // namespace txcore
