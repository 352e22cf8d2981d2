#include <spdlog/spdlog.h>
#include <ypbank/codec/dummy/codec.hpp>

namespace ypbank::codec {

std::vector<schema::tx_record_t> codec<dummy_format_tag>::parse(
    std::istream& input) const {
  static_cast<void>(input);
  return {};
}

void codec<dummy_format_tag>::write(
    std::ostream& output,
    const std::vector<schema::tx_record_t>& records) const {
  static_cast<void>(output);
  spdlog::debug("Discarding {} record(s)", records.size());
}

}  // namespace ypbank::codec
