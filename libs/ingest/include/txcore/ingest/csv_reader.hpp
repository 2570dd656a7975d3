#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "txcore/common/types.hpp"

namespace txcore {
namespace ingest {

enum class ReadStatus : std::uint8_t {
  kRecord,
  kParseError,
  kEndOfStream,
};

struct ReaderOptions {
  bool has_headers{true};
  bool trim{true};
  char delimiter{','};
};

// Single-pass reader of transaction rows: type,client,tx,amount.
//
// A malformed row yields kParseError and the reader stays positioned on the
// next row. Conditions that stop all progress throw std::runtime_error: the
// input cannot be opened, the header lacks a required column, or the stream
// fails mid-read.
class CsvReader {
 public:
  explicit CsvReader(const std::filesystem::path& path, ReaderOptions options = {});
  explicit CsvReader(std::istream& input, ReaderOptions options = {});
  CsvReader(const CsvReader&) = delete;
  CsvReader& operator=(const CsvReader&) = delete;
  CsvReader(CsvReader&&) = delete;
  CsvReader& operator=(CsvReader&&) = delete;

  [[nodiscard]] ReadStatus next(common::TransactionRecord& out_record);

  [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }
  // 1-based line number of the row last returned.
  [[nodiscard]] std::uint64_t line() const noexcept { return line_; }

 private:
  struct ColumnMap {
    std::size_t type{0};
    std::size_t client{1};
    std::size_t tx{2};
    std::optional<std::size_t> amount{3};
    std::size_t width{4};
  };

  std::unique_ptr<std::ifstream> file_{};
  std::istream* input_{nullptr};
  ReaderOptions options_{};
  ColumnMap columns_{};
  bool header_consumed_{false};
  std::uint64_t line_{0};
  std::string last_error_{};
  std::string buffer_{};

  bool read_line(std::string& out);
  bool consume_header();
  ReadStatus parse_row(std::string_view row, common::TransactionRecord& out_record);
  ReadStatus fail(std::string message);
};

// Splits one row on `delimiter`, honouring double-quoted fields with "" escapes.
// Returns std::nullopt for an unterminated quote.
[[nodiscard]] std::optional<std::vector<std::string>> split_fields(std::string_view row, char delimiter);

}  // namespace ingest
}  // namespace txcore
