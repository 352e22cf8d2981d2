#pragma once
#include <ypbank/codec/codec.hpp>

namespace ypbank::codec {

struct dummy_format_tag {};

// No-op format: parses to nothing and writes nothing. Used to validate an
// input without producing output.
template <>
struct codec<dummy_format_tag> final {
  std::vector<schema::tx_record_t> parse(std::istream& input) const;

  void write(std::ostream& output,
             const std::vector<schema::tx_record_t>& records) const;
};

}  // namespace ypbank::codec
