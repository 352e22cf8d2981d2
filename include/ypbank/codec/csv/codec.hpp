#pragma once
#include <ypbank/codec/codec.hpp>

#include <string>
#include <string_view>

namespace ypbank::codec {

struct csv_format_tag {};

namespace csv {

inline constexpr auto kHeader = std::string_view{
    "TX_ID,TX_TYPE,FROM_USER_ID,TO_USER_ID,AMOUNT,TIMESTAMP,STATUS,"
    "DESCRIPTION"};

inline constexpr auto kDelimiter = ',';

/// Parse one data row. Commas are never escaped, so a description that
/// contains one yields too many columns and is rejected.
schema::tx_record_t parse_row(std::string_view line);

std::string format_row(const schema::tx_record_t& record);

}  // namespace csv

// Fixed header line followed by one eight-column row per record.
template <>
struct codec<csv_format_tag> final {
  std::vector<schema::tx_record_t> parse(std::istream& input) const;

  void write(std::ostream& output,
             const std::vector<schema::tx_record_t>& records) const;
};

}  // namespace ypbank::codec
