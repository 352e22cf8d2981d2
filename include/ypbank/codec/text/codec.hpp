#pragma once
#include <ypbank/codec/codec.hpp>

namespace ypbank::codec {

struct text_format_tag {};

// Blocks of `KEY: value` lines separated by blank lines; `#` starts a
// full-line comment.
template <>
struct codec<text_format_tag> final {
  std::vector<schema::tx_record_t> parse(std::istream& input) const;

  void write(std::ostream& output,
             const std::vector<schema::tx_record_t>& records) const;
};

}  // namespace ypbank::codec
