#include "txcore/common/status.hpp"
#include "txcore/common/types.hpp"

#include <array>
#include <cctype>

namespace txcore {
namespace common {

namespace {

bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(lhs[i])) != rhs[i]) {
      return false;
    }
  }
  return true;
}

constexpr std::array<RecordKind, kRecordKindCount> kAllKinds{
    RecordKind::kDeposit,
    RecordKind::kWithdrawal,
    RecordKind::kDispute,
    RecordKind::kResolve,
    RecordKind::kChargeback,
};

}  // namespace

std::string_view to_string(RecordKind kind) noexcept {
  switch (kind) {
    case RecordKind::kDeposit:
      return "deposit";
    case RecordKind::kWithdrawal:
      return "withdrawal";
    case RecordKind::kDispute:
      return "dispute";
    case RecordKind::kResolve:
      return "resolve";
    case RecordKind::kChargeback:
      return "chargeback";
  }
  return "unknown";
}

std::optional<RecordKind> parse_record_kind(std::string_view text) noexcept {
  for (const auto kind : kAllKinds) {
    if (iequals(text, to_string(kind))) {
      return kind;
    }
  }
  return std::nullopt;
}

std::string_view to_string(Status status) noexcept {
  switch (status) {
    case Status::kOk:
      return "ok";
    case Status::kInvalidAmount:
      return "invalid_amount";
    case Status::kUnknownClient:
      return "unknown_client";
    case Status::kUnknownTransaction:
      return "unknown_transaction";
    case Status::kClientMismatch:
      return "client_mismatch";
    case Status::kDuplicateTransactionId:
      return "duplicate_transaction_id";
    case Status::kInsufficientFunds:
      return "insufficient_funds";
    case Status::kAccountLocked:
      return "account_locked";
    case Status::kInvalidStateTransition:
      return "invalid_state_transition";
  }
  return "unknown";
}

}  // namespace common
}  // namespace txcore
