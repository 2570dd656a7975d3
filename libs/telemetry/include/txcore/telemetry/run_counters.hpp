#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "txcore/common/status.hpp"
#include "txcore/common/types.hpp"

namespace txcore {
namespace telemetry {

// Outcome counts for one run of the processor.
class RunCounters {
 public:
  void record_applied(common::RecordKind kind) noexcept;
  void record_rejected(common::RecordKind kind, common::Status status) noexcept;
  void record_parse_error() noexcept;

  [[nodiscard]] std::uint64_t records_read() const noexcept { return applied_total_ + rejected_total_ + parse_errors_; }
  [[nodiscard]] std::uint64_t applied(common::RecordKind kind) const noexcept;
  [[nodiscard]] std::uint64_t rejected(common::RecordKind kind) const noexcept;
  [[nodiscard]] std::uint64_t rejected(common::Status status) const noexcept;
  [[nodiscard]] std::uint64_t applied_total() const noexcept { return applied_total_; }
  [[nodiscard]] std::uint64_t rejected_total() const noexcept { return rejected_total_; }
  [[nodiscard]] std::uint64_t parse_errors() const noexcept { return parse_errors_; }

  // e.g. "read=5 applied=4 rejected=1 parse_errors=0 [deposit=3 withdrawal=1] [insufficient_funds=1]"
  [[nodiscard]] std::string summary() const;

 private:
  std::array<std::uint64_t, common::kRecordKindCount> applied_by_kind_{};
  std::array<std::uint64_t, common::kRecordKindCount> rejected_by_kind_{};
  std::array<std::uint64_t, common::kStatusCount> rejected_by_status_{};
  std::uint64_t applied_total_{0};
  std::uint64_t rejected_total_{0};
  std::uint64_t parse_errors_{0};
};

}  // namespace telemetry
}  // namespace txcore
