#include "txcore/snapshot/csv_writer.hpp"

#include <sstream>
#include <stdexcept>

namespace txcore {
namespace snapshot {

namespace {

void write_row(std::ostream& out, const processor::AccountSnapshot& account) {
  out << account.client << ',' << account.available.to_decimal_text() << ','
      << account.held.to_decimal_text() << ',' << account.total.to_decimal_text() << ','
      << (account.locked ? "true" : "false") << '\n';
}

}  // namespace

CsvWriter::CsvWriter(std::ostream& out)
    : out_(&out) {}

void CsvWriter::write(std::span<const processor::AccountSnapshot> accounts) {
  *out_ << kHeader << '\n';
  for (const auto& account : accounts) {
    write_row(*out_, account);
  }
  out_->flush();
  if (!*out_) {
    throw std::runtime_error("failed to write account snapshot");
  }
}

std::string CsvWriter::render(std::span<const processor::AccountSnapshot> accounts) {
  std::ostringstream oss;
  CsvWriter(oss).write(accounts);
  return oss.str();
}

}  // namespace snapshot
}  // namespace txcore
