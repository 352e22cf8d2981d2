#pragma once

#include <ypbank/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: record field key.
// Declaration order is the canonical field order used by every writer, by the
// CSV header and by missing-field detection.
namespace ypbank::schema {

enum class field_key_t : uint8_t {
  id = 0,
  kind = 1,
  from = 2,
  to = 3,
  amount = 4,
  timestamp = 5,
  status = 6,
  description = 7
};

inline constexpr auto kFieldKeyMappings = token_mappings_t<field_key_t, 8>{
    std::pair<std::string_view, field_key_t>{"TX_ID", field_key_t::id},
    std::pair<std::string_view, field_key_t>{"TX_TYPE", field_key_t::kind},
    std::pair<std::string_view, field_key_t>{"FROM_USER_ID",
                                             field_key_t::from},
    std::pair<std::string_view, field_key_t>{"TO_USER_ID", field_key_t::to},
    std::pair<std::string_view, field_key_t>{"AMOUNT", field_key_t::amount},
    std::pair<std::string_view, field_key_t>{"TIMESTAMP",
                                             field_key_t::timestamp},
    std::pair<std::string_view, field_key_t>{"STATUS", field_key_t::status},
    std::pair<std::string_view, field_key_t>{"DESCRIPTION",
                                             field_key_t::description}};

inline constexpr auto kFieldCount = kFieldKeyMappings.size();

template <>
inline std::optional<field_key_t> try_from_string<field_key_t>(
    const std::string_view value) {
  return find_enum(value, kFieldKeyMappings);
}

inline constexpr std::string_view to_string(const field_key_t value) {
  return find_key(value, kFieldKeyMappings).value_or("unknown");
}

}  // namespace ypbank::schema
