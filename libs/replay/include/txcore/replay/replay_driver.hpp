#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <string_view>
#include <vector>

#include "txcore/common/status.hpp"
#include "txcore/common/types.hpp"
#include "txcore/ingest/csv_reader.hpp"
#include "txcore/processor/processor.hpp"
#include "txcore/telemetry/run_counters.hpp"

namespace txcore {
namespace replay {

struct RunResult {
  std::vector<processor::AccountSnapshot> accounts;
  telemetry::RunCounters counters;
};

// Feeds every input row through a fresh Processor. Rejected records and
// malformed rows are reported to the handlers and skipped; the run only
// stops early on exceptions from the reader or from amount overflow.
class Driver {
 public:
  using RejectHandler =
      std::function<void(std::uint64_t line, const common::TransactionRecord&, common::Status)>;
  using ParseErrorHandler = std::function<void(std::uint64_t line, std::string_view message)>;

  Driver();

  void configure(ingest::ReaderOptions options, processor::SnapshotOrder order);
  void set_reject_handler(RejectHandler handler);
  void set_parse_error_handler(ParseErrorHandler handler);

  [[nodiscard]] RunResult execute(const std::filesystem::path& input) const;
  [[nodiscard]] RunResult execute(std::istream& input) const;

 private:
  ingest::ReaderOptions options_{};
  processor::SnapshotOrder order_{processor::SnapshotOrder::kFirstSeen};
  RejectHandler reject_handler_{};
  ParseErrorHandler parse_error_handler_{};

  RunResult run(ingest::CsvReader& reader) const;
};

}  // namespace replay
}  // namespace txcore
