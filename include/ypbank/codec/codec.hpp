#pragma once
#include <ypbank/schema/transaction_record.hpp>

#include <istream>
#include <ostream>
#include <vector>

namespace ypbank::codec {

// One specialization per file format, selected by a tag type:
//   auto records = codec<binary_format_tag>{}.parse(input);
//   codec<csv_format_tag>{}.write(output, records);
// Codecs hold no state between calls. Both operations are fail-fast and
// throw app_error; parse never returns a partial sequence.
template <typename Format>
struct codec {
  std::vector<schema::tx_record_t> parse(std::istream& input) const;

  void write(std::ostream& output,
             const std::vector<schema::tx_record_t>& records) const;
};

}  // namespace ypbank::codec
