#include <ypbank/codec/binary/codec.hpp>
#include <ypbank/codec/csv/codec.hpp>
#include <ypbank/codec/dummy/codec.hpp>
#include <ypbank/codec/format.hpp>
#include <ypbank/codec/text/codec.hpp>
#include <ypbank/common/critical.hpp>

namespace ypbank::codec {

std::vector<schema::tx_record_t> parse_records(const format_t format,
                                               std::istream& input) {
  switch (format) {
    case format_t::binary:
      return codec<binary_format_tag>{}.parse(input);
    case format_t::text:
      return codec<text_format_tag>{}.parse(input);
    case format_t::csv:
      return codec<csv_format_tag>{}.parse(input);
    case format_t::dummy:
      return codec<dummy_format_tag>{}.parse(input);
  }
  common::critical("unsupported format {}", static_cast<int>(format));
}

void write_records(const format_t format,
                   std::ostream& output,
                   const std::vector<schema::tx_record_t>& records) {
  switch (format) {
    case format_t::binary:
      codec<binary_format_tag>{}.write(output, records);
      return;
    case format_t::text:
      codec<text_format_tag>{}.write(output, records);
      return;
    case format_t::csv:
      codec<csv_format_tag>{}.write(output, records);
      return;
    case format_t::dummy:
      codec<dummy_format_tag>{}.write(output, records);
      return;
  }
  common::critical("unsupported format {}", static_cast<int>(format));
}

}  // namespace ypbank::codec
