#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string_view>

namespace txcore {
namespace telemetry {

enum class LogLevel : std::uint8_t {
  kDebug,
  kInfo,
  kWarn,
  kError,
  kOff,
};

[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

// Line-oriented diagnostics: "[YYYY-MM-DD HH:MM:SS][LEVEL] message".
// Never writes to stdout, which carries the account snapshot.
class Logger {
 public:
  explicit Logger(LogLevel level = LogLevel::kWarn);
  // Appends to `path`; throws std::runtime_error when it cannot be opened.
  Logger(LogLevel level, const std::filesystem::path& path);
  Logger(LogLevel level, std::ostream& sink);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void log(LogLevel level, std::string_view message);
  void debug(std::string_view message) { log(LogLevel::kDebug, message); }
  void info(std::string_view message) { log(LogLevel::kInfo, message); }
  void warn(std::string_view message) { log(LogLevel::kWarn, message); }
  void error(std::string_view message) { log(LogLevel::kError, message); }

  [[nodiscard]] bool enabled(LogLevel level) const noexcept;
  [[nodiscard]] LogLevel level() const noexcept { return level_; }

 private:
  std::mutex mutex_;
  LogLevel level_{LogLevel::kWarn};
  std::unique_ptr<std::ofstream> file_{};
  std::ostream* sink_{nullptr};
};

}  // namespace telemetry
}  // namespace txcore
