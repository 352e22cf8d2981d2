#pragma once

#include <ypbank/schema/enum_string.hpp>
#include <ypbank/schema/transaction_record.hpp>

#include <array>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

namespace ypbank::codec {

enum class format_t : uint8_t { binary = 0, text = 1, csv = 2, dummy = 3 };

inline constexpr auto kFormatMappings = schema::token_mappings_t<format_t, 4>{
    std::pair<std::string_view, format_t>{"binary", format_t::binary},
    std::pair<std::string_view, format_t>{"text", format_t::text},
    std::pair<std::string_view, format_t>{"csv", format_t::csv},
    std::pair<std::string_view, format_t>{"dummy", format_t::dummy}};

inline constexpr std::string_view to_string(const format_t value) {
  return schema::find_key(value, kFormatMappings).value_or("unknown");
}

/// Read every record from `input` with the codec for `format`.
std::vector<schema::tx_record_t> parse_records(format_t format,
                                               std::istream& input);

/// Write `records` to `output` with the codec for `format`.
void write_records(format_t format,
                   std::ostream& output,
                   const std::vector<schema::tx_record_t>& records);

}  // namespace ypbank::codec

namespace ypbank::schema {

template <>
inline std::optional<codec::format_t> try_from_string<codec::format_t>(
    const std::string_view value) {
  return find_enum(value, codec::kFormatMappings);
}

}  // namespace ypbank::schema
