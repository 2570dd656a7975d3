#include "txcore/ledger/ledger_state.hpp"

namespace txcore {
namespace ledger {

std::string_view to_string(DisputeState state) noexcept {
  switch (state) {
    case DisputeState::kClean:
      return "clean";
    case DisputeState::kDisputed:
      return "disputed";
    case DisputeState::kResolved:
      return "resolved";
    case DisputeState::kChargedBack:
      return "charged_back";
  }
  return "unknown";
}

common::Status LedgerState::record_deposit(common::TxId tx, common::ClientId client, common::Amount amount) {
  if (contains(tx)) {
    return common::Status::kDuplicateTransactionId;
  }
  deposits_.emplace(tx, LedgerEntry{.tx = tx, .client = client, .amount = amount, .state = DisputeState::kClean});
  return common::Status::kOk;
}

common::Status LedgerState::record_withdrawal(common::TxId tx) {
  if (contains(tx)) {
    return common::Status::kDuplicateTransactionId;
  }
  withdrawals_.insert(tx);
  return common::Status::kOk;
}

LedgerResult LedgerState::dispute(common::TxId tx, common::ClientId client) {
  return transition(tx, client, DisputeState::kClean, DisputeState::kDisputed);
}

LedgerResult LedgerState::resolve(common::TxId tx, common::ClientId client) {
  return transition(tx, client, DisputeState::kDisputed, DisputeState::kResolved);
}

LedgerResult LedgerState::chargeback(common::TxId tx, common::ClientId client) {
  return transition(tx, client, DisputeState::kDisputed, DisputeState::kChargedBack);
}

bool LedgerState::contains(common::TxId tx) const {
  return deposits_.contains(tx) || withdrawals_.contains(tx);
}

const LedgerEntry* LedgerState::find(common::TxId tx) const {
  if (auto it = deposits_.find(tx); it != deposits_.end()) {
    return &it->second;
  }
  return nullptr;
}

LedgerResult LedgerState::transition(common::TxId tx, common::ClientId client, DisputeState from, DisputeState to) {
  auto it = deposits_.find(tx);
  if (it == deposits_.end()) {
    return {.status = common::Status::kUnknownTransaction};
  }
  auto& entry = it->second;
  if (entry.client != client) {
    return {.status = common::Status::kClientMismatch};
  }
  if (entry.state != from) {
    return {.status = common::Status::kInvalidStateTransition};
  }
  entry.state = to;
  return {.status = common::Status::kOk, .amount = entry.amount};
}

}  // namespace ledger
}  // namespace txcore
