#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "txcore/account/account.hpp"
#include "txcore/common/amount.hpp"
#include "txcore/common/status.hpp"
#include "txcore/common/types.hpp"
#include "txcore/ledger/ledger_state.hpp"

namespace txcore {
namespace processor {

// State of a single run. Built fresh per run and moved into the Processor.
struct Store {
  account::AccountBook accounts;
  ledger::LedgerState ledger;
};

struct AccountSnapshot {
  common::ClientId client{0};
  common::Amount available{};
  common::Amount held{};
  common::Amount total{};
  bool locked{false};

  bool operator==(const AccountSnapshot&) const = default;
};

enum class SnapshotOrder : std::uint8_t {
  kFirstSeen,
  kClientId,
};

class Processor {
 public:
  Processor() = default;
  explicit Processor(Store store);

  // Applies one record. A non-ok status means nothing was mutated.
  [[nodiscard]] common::Status apply(const common::TransactionRecord& record);

  [[nodiscard]] std::vector<AccountSnapshot> snapshot(SnapshotOrder order = SnapshotOrder::kFirstSeen) const;
  [[nodiscard]] std::optional<AccountSnapshot> account(common::ClientId client) const;
  [[nodiscard]] std::size_t account_count() const noexcept { return store_.accounts.size(); }

 private:
  Store store_{};

  common::Status apply_deposit(const common::TransactionRecord& record);
  common::Status apply_withdrawal(const common::TransactionRecord& record);
  common::Status apply_dispute(const common::TransactionRecord& record);
  common::Status apply_resolve(const common::TransactionRecord& record);
  common::Status apply_chargeback(const common::TransactionRecord& record);

  // Shared precondition of the dispute family: a locked account rejects
  // every further record before the ledger is consulted.
  [[nodiscard]] common::Status check_unlocked(common::ClientId client) const;

  static AccountSnapshot make_snapshot(const account::Account& account);
};

}  // namespace processor
}  // namespace txcore
