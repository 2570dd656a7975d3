#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "txcore/common/status.hpp"
#include "txcore/common/types.hpp"
#include "txcore/config/config_loader.hpp"
#include "txcore/ingest/csv_reader.hpp"
#include "txcore/processor/processor.hpp"
#include "txcore/replay/replay_driver.hpp"
#include "txcore/snapshot/csv_writer.hpp"
#include "txcore/telemetry/logger.hpp"

namespace {

constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;

void print_usage(const char* program, std::ostream& out) {
  out << "Usage: " << program << " <transactions.csv>\n"
      << "  Applies the transactions in order and prints the final account\n"
      << "  balances as CSV on stdout. Rows that fail are skipped.\n"
      << "  Settings are read from ./txcore.toml or /etc/txcore/txcore.toml when present.\n";
}

std::filesystem::path find_config_path() {
  const std::filesystem::path default_paths[] = {
      "./txcore.toml",
      "/etc/txcore/txcore.toml",
  };

  for (const auto& path : default_paths) {
    if (std::filesystem::exists(path)) {
      return path;
    }
  }
  return {};
}

bool load_config(txcore::config::EngineConfig& cfg) {
  using txcore::config::ConfigLoader;

  const auto config_path = find_config_path();
  auto result = config_path.empty() ? ConfigLoader::load_from_string(ConfigLoader::generate_default())
                                    : ConfigLoader::load(config_path);
  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Config parse error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Config validation error [" << err.field << "]: " << err.message << "\n";
    }
    return false;
  }
  cfg = std::move(result.config);
  return true;
}

std::unique_ptr<txcore::telemetry::Logger> make_logger(const txcore::config::LoggingConfig& cfg) {
  using txcore::telemetry::LogLevel;
  const auto level = txcore::telemetry::parse_log_level(cfg.level).value_or(LogLevel::kInfo);
  if (cfg.path.empty()) {
    return std::make_unique<txcore::telemetry::Logger>(level);
  }
  return std::make_unique<txcore::telemetry::Logger>(level, cfg.path);
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace txcore;

  if (argc == 2 && (std::string_view{argv[1]} == "--help" || std::string_view{argv[1]} == "-h")) {
    print_usage(argv[0], std::cout);
    return 0;
  }
  if (argc != 2) {
    print_usage(argv[0], std::cerr);
    return kExitUsage;
  }
  const std::filesystem::path input_path{argv[1]};

  config::EngineConfig cfg;
  if (!load_config(cfg)) {
    return kExitFatal;
  }

  std::unique_ptr<telemetry::Logger> logger;
  try {
    logger = make_logger(cfg.logging);
  } catch (const std::exception& e) {
    std::cerr << "Failed to start logging: " << e.what() << "\n";
    return kExitFatal;
  }

  replay::Driver driver;
  driver.configure(
      ingest::ReaderOptions{
          .has_headers = cfg.input.has_headers,
          .trim = cfg.input.trim,
          .delimiter = cfg.input.delimiter.front(),
      },
      cfg.output.order == "client_id" ? processor::SnapshotOrder::kClientId : processor::SnapshotOrder::kFirstSeen);

  driver.set_reject_handler([&logger](std::uint64_t line, const common::TransactionRecord& record,
                                      common::Status status) {
    if (!logger->enabled(telemetry::LogLevel::kInfo)) {
      return;
    }
    logger->info("line " + std::to_string(line) + ": skipped " + std::string(common::to_string(record.kind)) +
                 " client=" + std::to_string(record.client) + " tx=" + std::to_string(record.tx) + ": " +
                 std::string(common::to_string(status)));
  });
  driver.set_parse_error_handler([&logger](std::uint64_t line, std::string_view message) {
    logger->info("line " + std::to_string(line) + ": skipped malformed row: " + std::string(message));
  });

  logger->info("processing " + input_path.string());
  try {
    const auto result = driver.execute(input_path);
    snapshot::CsvWriter writer(std::cout);
    writer.write(result.accounts);
    logger->info("run complete: " + result.counters.summary());
  } catch (const std::exception& e) {
    if (!cfg.logging.path.empty()) {
      logger->error(std::string("fatal: ") + e.what());
    }
    std::cerr << "Failed to process input: " << e.what() << "\n";
    return kExitFatal;
  }

  return 0;
}
