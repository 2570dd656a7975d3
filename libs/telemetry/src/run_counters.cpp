#include "txcore/telemetry/run_counters.hpp"

#include <sstream>

namespace txcore {
namespace telemetry {

namespace {

constexpr std::size_t index_of(common::RecordKind kind) noexcept {
  return static_cast<std::size_t>(kind);
}

constexpr std::size_t index_of(common::Status status) noexcept {
  return static_cast<std::size_t>(status);
}

}  // namespace

void RunCounters::record_applied(common::RecordKind kind) noexcept {
  ++applied_by_kind_[index_of(kind)];
  ++applied_total_;
}

void RunCounters::record_rejected(common::RecordKind kind, common::Status status) noexcept {
  ++rejected_by_kind_[index_of(kind)];
  ++rejected_by_status_[index_of(status)];
  ++rejected_total_;
}

void RunCounters::record_parse_error() noexcept {
  ++parse_errors_;
}

std::uint64_t RunCounters::applied(common::RecordKind kind) const noexcept {
  return applied_by_kind_[index_of(kind)];
}

std::uint64_t RunCounters::rejected(common::RecordKind kind) const noexcept {
  return rejected_by_kind_[index_of(kind)];
}

std::uint64_t RunCounters::rejected(common::Status status) const noexcept {
  return rejected_by_status_[index_of(status)];
}

std::string RunCounters::summary() const {
  std::ostringstream oss;
  oss << "read=" << records_read() << " applied=" << applied_total_ << " rejected=" << rejected_total_
      << " parse_errors=" << parse_errors_;

  oss << " [";
  bool first = true;
  for (std::size_t idx = 0; idx < applied_by_kind_.size(); ++idx) {
    if (applied_by_kind_[idx] == 0) {
      continue;
    }
    oss << (first ? "" : " ") << common::to_string(static_cast<common::RecordKind>(idx)) << '='
        << applied_by_kind_[idx];
    first = false;
  }
  oss << "] [";
  first = true;
  for (std::size_t idx = 0; idx < rejected_by_status_.size(); ++idx) {
    if (rejected_by_status_[idx] == 0) {
      continue;
    }
    oss << (first ? "" : " ") << common::to_string(static_cast<common::Status>(idx)) << '='
        << rejected_by_status_[idx];
    first = false;
  }
  oss << ']';
  return oss.str();
}

}  // namespace telemetry
}  // namespace txcore
