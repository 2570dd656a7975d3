#include "txcore/ingest/csv_reader.hpp"

#include <cctype>
#include <charconv>
#include <stdexcept>
#include <utility>

namespace txcore {
namespace ingest {

namespace {

constexpr std::string_view kUtf8Bom{"\xEF\xBB\xBF"};

std::string_view trim(std::string_view text) noexcept {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

bool is_blank(std::string_view text) noexcept {
  return trim(text).empty();
}

std::string lowercase(std::string_view text) {
  std::string out(text);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::optional<std::uint64_t> parse_id(std::string_view text) noexcept {
  if (text.empty()) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  const auto* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<std::vector<std::string>> split_fields(std::string_view row, char delimiter) {
  std::vector<std::string> fields;
  std::string current;
  bool in_quotes = false;

  for (std::size_t i = 0; i < row.size(); ++i) {
    const char c = row[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < row.size() && row[i + 1] == '"') {
          current.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        current.push_back(c);
      }
    } else if (c == '"') {
      in_quotes = true;
    } else if (c == delimiter) {
      fields.push_back(std::move(current));
      current.clear();
    } else {
      current.push_back(c);
    }
  }

  if (in_quotes) {
    return std::nullopt;
  }
  fields.push_back(std::move(current));
  return fields;
}

CsvReader::CsvReader(const std::filesystem::path& path, ReaderOptions options)
    : file_(std::make_unique<std::ifstream>(path)),
      options_(options) {
  if (!*file_) {
    throw std::runtime_error("failed to open input file: " + path.string());
  }
  input_ = file_.get();
}

CsvReader::CsvReader(std::istream& input, ReaderOptions options)
    : input_(&input), options_(options) {}

bool CsvReader::read_line(std::string& out) {
  if (!std::getline(*input_, out)) {
    if (input_->bad()) {
      throw std::runtime_error("I/O failure while reading input at line " + std::to_string(line_ + 1));
    }
    return false;
  }
  ++line_;
  if (line_ == 1 && out.starts_with(kUtf8Bom)) {
    out.erase(0, kUtf8Bom.size());
  }
  if (!out.empty() && out.back() == '\r') {
    out.pop_back();
  }
  return true;
}

bool CsvReader::consume_header() {
  header_consumed_ = true;
  if (!options_.has_headers) {
    return true;
  }

  while (read_line(buffer_)) {
    if (is_blank(buffer_)) {
      continue;
    }
    auto fields = split_fields(buffer_, options_.delimiter);
    if (!fields) {
      throw std::runtime_error("malformed header at line " + std::to_string(line_) + ": unterminated quote");
    }

    std::optional<std::size_t> type;
    std::optional<std::size_t> client;
    std::optional<std::size_t> tx;
    std::optional<std::size_t> amount;
    for (std::size_t idx = 0; idx < fields->size(); ++idx) {
      const auto name = lowercase(trim((*fields)[idx]));
      if (name == "type") {
        type = idx;
      } else if (name == "client") {
        client = idx;
      } else if (name == "tx") {
        tx = idx;
      } else if (name == "amount") {
        amount = idx;
      }
    }

    if (!type || !client || !tx) {
      throw std::runtime_error("header at line " + std::to_string(line_) +
                               " must name the columns type, client and tx");
    }
    columns_ = ColumnMap{
        .type = *type,
        .client = *client,
        .tx = *tx,
        .amount = amount,
        .width = fields->size(),
    };
    return true;
  }
  return false;
}

ReadStatus CsvReader::next(common::TransactionRecord& out_record) {
  last_error_.clear();
  if (!header_consumed_ && !consume_header()) {
    return ReadStatus::kEndOfStream;
  }

  while (read_line(buffer_)) {
    if (is_blank(buffer_)) {
      continue;
    }
    return parse_row(buffer_, out_record);
  }
  return ReadStatus::kEndOfStream;
}

ReadStatus CsvReader::parse_row(std::string_view row, common::TransactionRecord& out_record) {
  auto fields = split_fields(row, options_.delimiter);
  if (!fields) {
    return fail("unterminated quote");
  }

  // The amount may be left off entirely when it is the trailing column.
  const bool amount_is_last = columns_.amount && *columns_.amount + 1 == columns_.width;
  const bool short_row = amount_is_last && fields->size() + 1 == columns_.width;
  if (fields->size() != columns_.width && !short_row) {
    return fail("expected " + std::to_string(columns_.width) + " fields, found " + std::to_string(fields->size()));
  }

  auto field = [&](std::size_t idx) -> std::string_view {
    std::string_view value = (*fields)[idx];
    return options_.trim ? trim(value) : value;
  };

  const auto kind = common::parse_record_kind(field(columns_.type));
  if (!kind) {
    return fail("unknown transaction type '" + std::string(field(columns_.type)) + "'");
  }
  const auto client = parse_id(field(columns_.client));
  if (!client) {
    return fail("invalid client id '" + std::string(field(columns_.client)) + "'");
  }
  const auto tx = parse_id(field(columns_.tx));
  if (!tx) {
    return fail("invalid tx id '" + std::string(field(columns_.tx)) + "'");
  }

  std::optional<common::Amount> amount;
  if (columns_.amount && *columns_.amount < fields->size()) {
    const auto text = field(*columns_.amount);
    if (!options_.trim && !is_blank(text) && trim(text).size() != text.size()) {
      return fail("invalid amount '" + std::string(text) + "'");
    }
    if (!is_blank(text)) {
      amount = common::Amount::from_decimal_text(text);
      if (!amount) {
        return fail("invalid amount '" + std::string(text) + "'");
      }
    }
  }

  if (common::RequiresAmount(*kind) && !amount) {
    return fail(std::string(common::to_string(*kind)) + " requires an amount");
  }
  if (!common::RequiresAmount(*kind) && amount) {
    return fail(std::string(common::to_string(*kind)) + " must not carry an amount");
  }

  out_record = common::TransactionRecord{
      .kind = *kind,
      .client = *client,
      .tx = *tx,
      .amount = amount,
  };
  return ReadStatus::kRecord;
}

ReadStatus CsvReader::fail(std::string message) {
  last_error_ = std::move(message);
  return ReadStatus::kParseError;
}

}  // namespace ingest
}  // namespace txcore
