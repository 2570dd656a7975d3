#include "txcore/processor/processor.hpp"

#include <algorithm>
#include <utility>

namespace txcore {
namespace processor {

namespace {

bool has_positive_amount(const common::TransactionRecord& record) noexcept {
  return record.amount.has_value() && record.amount->is_positive();
}

}  // namespace

Processor::Processor(Store store)
    : store_(std::move(store)) {}

common::Status Processor::apply(const common::TransactionRecord& record) {
  switch (record.kind) {
    case common::RecordKind::kDeposit:
      return apply_deposit(record);
    case common::RecordKind::kWithdrawal:
      return apply_withdrawal(record);
    case common::RecordKind::kDispute:
      return apply_dispute(record);
    case common::RecordKind::kResolve:
      return apply_resolve(record);
    case common::RecordKind::kChargeback:
      return apply_chargeback(record);
  }
  return common::Status::kInvalidStateTransition;
}

common::Status Processor::apply_deposit(const common::TransactionRecord& record) {
  if (!has_positive_amount(record)) {
    return common::Status::kInvalidAmount;
  }
  if (const auto status = check_unlocked(record.client); !common::Ok(status)) {
    return status;
  }
  if (store_.ledger.contains(record.tx)) {
    return common::Status::kDuplicateTransactionId;
  }

  auto& account = store_.accounts.ensure(record.client);
  if (const auto status = account.deposit(*record.amount); !common::Ok(status)) {
    return status;
  }
  return store_.ledger.record_deposit(record.tx, record.client, *record.amount);
}

common::Status Processor::apply_withdrawal(const common::TransactionRecord& record) {
  if (!has_positive_amount(record)) {
    return common::Status::kInvalidAmount;
  }
  auto* account = store_.accounts.find(record.client);
  if (!account) {
    return common::Status::kUnknownClient;
  }
  if (account->locked()) {
    return common::Status::kAccountLocked;
  }
  if (store_.ledger.contains(record.tx)) {
    return common::Status::kDuplicateTransactionId;
  }

  if (const auto status = account->withdraw(*record.amount); !common::Ok(status)) {
    return status;
  }
  return store_.ledger.record_withdrawal(record.tx);
}

common::Status Processor::apply_dispute(const common::TransactionRecord& record) {
  if (const auto status = check_unlocked(record.client); !common::Ok(status)) {
    return status;
  }
  const auto result = store_.ledger.dispute(record.tx, record.client);
  if (!common::Ok(result.status)) {
    return result.status;
  }
  // A ledger entry implies the deposit created the account.
  return store_.accounts.ensure(record.client).hold(result.amount);
}

common::Status Processor::apply_resolve(const common::TransactionRecord& record) {
  if (const auto status = check_unlocked(record.client); !common::Ok(status)) {
    return status;
  }
  const auto result = store_.ledger.resolve(record.tx, record.client);
  if (!common::Ok(result.status)) {
    return result.status;
  }
  return store_.accounts.ensure(record.client).release(result.amount);
}

common::Status Processor::apply_chargeback(const common::TransactionRecord& record) {
  if (const auto status = check_unlocked(record.client); !common::Ok(status)) {
    return status;
  }
  const auto result = store_.ledger.chargeback(record.tx, record.client);
  if (!common::Ok(result.status)) {
    return result.status;
  }
  return store_.accounts.ensure(record.client).chargeback(result.amount);
}

common::Status Processor::check_unlocked(common::ClientId client) const {
  const auto* account = store_.accounts.find(client);
  if (account && account->locked()) {
    return common::Status::kAccountLocked;
  }
  return common::Status::kOk;
}

std::vector<AccountSnapshot> Processor::snapshot(SnapshotOrder order) const {
  std::vector<AccountSnapshot> out;
  out.reserve(store_.accounts.size());
  for (const auto client : store_.accounts.first_seen_order()) {
    if (const auto* account = store_.accounts.find(client)) {
      out.push_back(make_snapshot(*account));
    }
  }

  if (order == SnapshotOrder::kClientId) {
    std::sort(out.begin(), out.end(), [](const AccountSnapshot& lhs, const AccountSnapshot& rhs) {
      return lhs.client < rhs.client;
    });
  }
  return out;
}

std::optional<AccountSnapshot> Processor::account(common::ClientId client) const {
  if (const auto* account = store_.accounts.find(client)) {
    return make_snapshot(*account);
  }
  return std::nullopt;
}

AccountSnapshot Processor::make_snapshot(const account::Account& account) {
  return AccountSnapshot{
      .client = account.client(),
      .available = account.available(),
      .held = account.held(),
      .total = account.total(),
      .locked = account.locked(),
  };
}

}  // namespace processor
}  // namespace txcore
