#include "test_telemetry.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include "txcore/telemetry/logger.hpp"
#include "txcore/telemetry/run_counters.hpp"

namespace txcore::tests {

void test_logger_levels() {
  assert(telemetry::parse_log_level("WARN") == telemetry::LogLevel::kWarn);
  assert(telemetry::parse_log_level("debug") == telemetry::LogLevel::kDebug);
  assert(!telemetry::parse_log_level("verbose").has_value());

  std::ostringstream sink;
  telemetry::Logger logger(telemetry::LogLevel::kInfo, sink);
  assert(!logger.enabled(telemetry::LogLevel::kDebug));
  assert(logger.enabled(telemetry::LogLevel::kError));
  logger.debug("hidden");
  logger.info("line 3: skipped");
  logger.error("fatal");
  const auto text = sink.str();
  assert(text.find("hidden") == std::string::npos);
  assert(text.find("][INFO] line 3: skipped\n") != std::string::npos);
  assert(text.find("][ERROR] fatal\n") != std::string::npos);
  assert(text.front() == '[');

  std::ostringstream silent_sink;
  telemetry::Logger silent(telemetry::LogLevel::kOff, silent_sink);
  silent.error("nothing");
  assert(silent_sink.str().empty());

  namespace fs = std::filesystem;
  const auto tmp_root = fs::temp_directory_path() / "txcore_logger_tests";
  fs::remove_all(tmp_root);
  fs::create_directories(tmp_root);
  {
    telemetry::Logger file_logger(telemetry::LogLevel::kWarn, tmp_root / "run.log");
    file_logger.warn("to file");
  }
  std::ifstream in(tmp_root / "run.log");
  std::string line;
  assert(std::getline(in, line));
  assert(line.find("[WARN] to file") != std::string::npos);

  bool threw = false;
  try {
    telemetry::Logger bad(telemetry::LogLevel::kWarn, tmp_root / "missing_dir" / "run.log");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  fs::remove_all(tmp_root);
}

void test_run_counters() {
  telemetry::RunCounters counters;
  counters.record_applied(common::RecordKind::kDeposit);
  counters.record_applied(common::RecordKind::kDeposit);
  counters.record_applied(common::RecordKind::kWithdrawal);
  counters.record_rejected(common::RecordKind::kWithdrawal, common::Status::kInsufficientFunds);
  counters.record_parse_error();

  assert(counters.records_read() == 5);
  assert(counters.applied_total() == 3);
  assert(counters.rejected_total() == 1);
  assert(counters.applied(common::RecordKind::kDeposit) == 2);
  assert(counters.rejected(common::RecordKind::kWithdrawal) == 1);
  assert(counters.rejected(common::Status::kInsufficientFunds) == 1);
  assert(counters.rejected(common::Status::kAccountLocked) == 0);
  assert(counters.parse_errors() == 1);
  assert(counters.summary() ==
         "read=5 applied=3 rejected=1 parse_errors=1 [deposit=2 withdrawal=1] [insufficient_funds=1]");
}

}  // namespace txcore::tests
