#include "txcore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include "toml.hpp"

#include <array>
#include <sstream>

namespace txcore {
namespace config {

namespace {

constexpr std::array<std::string_view, 2> kOrders{"first_seen", "client_id"};
constexpr std::array<std::string_view, 5> kLevels{"debug", "info", "warn", "error", "off"};

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

template <std::size_t N>
bool one_of(const std::array<std::string_view, N>& allowed, std::string_view value) {
  for (const auto candidate : allowed) {
    if (candidate == value) {
      return true;
    }
  }
  return false;
}

InputConfig parse_input(const toml::table& root) {
  InputConfig cfg;
  if (auto* input = root["input"].as_table()) {
    cfg.has_headers = get_bool_or(*input, "has_headers", cfg.has_headers);
    cfg.trim = get_bool_or(*input, "trim", cfg.trim);
    cfg.delimiter = get_str_or(*input, "delimiter", cfg.delimiter);
  }
  return cfg;
}

OutputConfig parse_output(const toml::table& root) {
  OutputConfig cfg;
  if (auto* output = root["output"].as_table()) {
    cfg.order = get_str_or(*output, "order", cfg.order);
  }
  return cfg;
}

LoggingConfig parse_logging(const toml::table& root) {
  LoggingConfig cfg;
  if (auto* logging = root["logging"].as_table()) {
    cfg.level = get_str_or(*logging, "level", cfg.level);
    cfg.path = get_str_or(*logging, "path", cfg.path.string());
  }
  return cfg;
}

EngineConfig parse_config(const toml::table& root) {
  EngineConfig cfg;
  cfg.input = parse_input(root);
  cfg.output = parse_output(root);
  cfg.logging = parse_logging(root);
  return cfg;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

std::vector<ValidationError> ConfigLoader::validate(const EngineConfig& config) {
  std::vector<ValidationError> errors;

  if (config.input.delimiter.size() != 1) {
    errors.push_back({"input.delimiter", "must be exactly one character"});
  } else if (config.input.delimiter == "\"" || config.input.delimiter == "\n" || config.input.delimiter == "\r") {
    errors.push_back({"input.delimiter", "cannot be a quote or line break"});
  }

  if (!one_of(kOrders, config.output.order)) {
    errors.push_back({"output.order", "must be one of: first_seen, client_id"});
  }

  if (!one_of(kLevels, config.logging.level)) {
    errors.push_back({"logging.level", "must be one of: debug, info, warn, error, off"});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# txcore configuration
# Generated default configuration

[input]
has_headers = true
trim = true
delimiter = ","

[output]
order = "first_seen"  # or "client_id"

[logging]
level = "info"
path = ""  # empty: stderr
)";
}

}  // namespace config
}  // namespace txcore
