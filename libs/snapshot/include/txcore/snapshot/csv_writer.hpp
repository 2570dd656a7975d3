#pragma once

#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include "txcore/processor/processor.hpp"

namespace txcore {
namespace snapshot {

inline constexpr std::string_view kHeader = "client,available,held,total,locked";

class CsvWriter {
 public:
  explicit CsvWriter(std::ostream& out);

  // Throws std::runtime_error if the stream fails.
  void write(std::span<const processor::AccountSnapshot> accounts);

  [[nodiscard]] static std::string render(std::span<const processor::AccountSnapshot> accounts);

 private:
  std::ostream* out_;
};

}  // namespace snapshot
}  // namespace txcore
