#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace txcore {
namespace config {

struct InputConfig {
  bool has_headers{true};
  bool trim{true};
  std::string delimiter{","};
};

struct OutputConfig {
  std::string order{"first_seen"};  // first_seen | client_id
};

struct LoggingConfig {
  std::string level{"info"};  // debug | info | warn | error | off
  std::filesystem::path path{};  // empty: stderr
};

struct EngineConfig {
  InputConfig input;
  OutputConfig output;
  LoggingConfig logging;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const EngineConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace txcore
