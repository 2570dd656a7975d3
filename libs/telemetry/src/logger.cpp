#include "txcore/telemetry/logger.hpp"

#include <array>
#include <cctype>
#include <ctime>
#include <iostream>
#include <stdexcept>
#include <string>

namespace txcore {
namespace telemetry {

namespace {

std::string timestamp_now() {
  std::array<char, 32> buf{};
  const std::time_t now = std::time(nullptr);
  std::tm local{};
#if defined(_WIN32)
  localtime_s(&local, &now);
#else
  localtime_r(&now, &local);
#endif
  const auto written = std::strftime(buf.data(), buf.size(), "%Y-%m-%d %H:%M:%S", &local);
  return std::string(buf.data(), written);
}

std::string_view label(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
    case LogLevel::kOff:
      break;
  }
  return "OFF";
}

}  // namespace

std::string_view to_string(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
    case LogLevel::kOff:
      return "off";
  }
  return "off";
}

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
  for (const auto level : {LogLevel::kDebug, LogLevel::kInfo, LogLevel::kWarn, LogLevel::kError, LogLevel::kOff}) {
    const auto name = to_string(level);
    if (name.size() != text.size()) {
      continue;
    }
    bool match = true;
    for (std::size_t i = 0; i < name.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(text[i])) != name[i]) {
        match = false;
        break;
      }
    }
    if (match) {
      return level;
    }
  }
  return std::nullopt;
}

Logger::Logger(LogLevel level)
    : level_(level), sink_(&std::cerr) {}

Logger::Logger(LogLevel level, const std::filesystem::path& path)
    : level_(level),
      file_(std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app)) {
  if (!*file_) {
    throw std::runtime_error("failed to open log file: " + path.string());
  }
  sink_ = file_.get();
}

Logger::Logger(LogLevel level, std::ostream& sink)
    : level_(level), sink_(&sink) {}

bool Logger::enabled(LogLevel level) const noexcept {
  return level != LogLevel::kOff && level_ != LogLevel::kOff && level >= level_;
}

void Logger::log(LogLevel level, std::string_view message) {
  if (!enabled(level)) {
    return;
  }
  std::scoped_lock lock(mutex_);
  *sink_ << '[' << timestamp_now() << "][" << label(level) << "] " << message << '\n';
  sink_->flush();
}

}  // namespace telemetry
}  // namespace txcore
