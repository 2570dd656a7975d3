#include "txcore/replay/replay_driver.hpp"

#include <utility>

namespace txcore {
namespace replay {

Driver::Driver() = default;

void Driver::configure(ingest::ReaderOptions options, processor::SnapshotOrder order) {
  options_ = options;
  order_ = order;
}

void Driver::set_reject_handler(RejectHandler handler) {
  reject_handler_ = std::move(handler);
}

void Driver::set_parse_error_handler(ParseErrorHandler handler) {
  parse_error_handler_ = std::move(handler);
}

RunResult Driver::execute(const std::filesystem::path& input) const {
  ingest::CsvReader reader(input, options_);
  return run(reader);
}

RunResult Driver::execute(std::istream& input) const {
  ingest::CsvReader reader(input, options_);
  return run(reader);
}

RunResult Driver::run(ingest::CsvReader& reader) const {
  processor::Processor processor{processor::Store{}};
  RunResult result;

  common::TransactionRecord record;
  for (;;) {
    const auto read = reader.next(record);
    if (read == ingest::ReadStatus::kEndOfStream) {
      break;
    }
    if (read == ingest::ReadStatus::kParseError) {
      result.counters.record_parse_error();
      if (parse_error_handler_) {
        parse_error_handler_(reader.line(), reader.last_error());
      }
      continue;
    }

    const auto status = processor.apply(record);
    if (common::Ok(status)) {
      result.counters.record_applied(record.kind);
      continue;
    }
    result.counters.record_rejected(record.kind, status);
    if (reject_handler_) {
      reject_handler_(reader.line(), record, status);
    }
  }

  result.accounts = processor.snapshot(order_);
  return result;
}

}  // namespace replay
}  // namespace txcore
