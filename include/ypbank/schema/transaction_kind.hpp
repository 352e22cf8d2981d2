#pragma once

#include <ypbank/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: transaction kind.
// Deposit credits `to`, withdrawal debits `from`, transfer moves between
// both. None of that is enforced on the record itself.
namespace ypbank::schema {

enum class transaction_kind_t : uint8_t {
  deposit = 0,
  transfer = 1,
  withdrawal = 2
};

inline constexpr auto kTransactionKindMappings =
    token_mappings_t<transaction_kind_t, 3>{
        std::pair<std::string_view, transaction_kind_t>{
            "DEPOSIT", transaction_kind_t::deposit},
        std::pair<std::string_view, transaction_kind_t>{
            "TRANSFER", transaction_kind_t::transfer},
        std::pair<std::string_view, transaction_kind_t>{
            "WITHDRAWAL", transaction_kind_t::withdrawal}};

inline constexpr auto kTransactionKindCodes =
    code_mappings_t<transaction_kind_t, 3>{
        std::pair<uint8_t, transaction_kind_t>{0, transaction_kind_t::deposit},
        std::pair<uint8_t, transaction_kind_t>{1,
                                               transaction_kind_t::transfer},
        std::pair<uint8_t, transaction_kind_t>{
            2, transaction_kind_t::withdrawal}};

template <>
inline std::optional<transaction_kind_t> try_from_string<transaction_kind_t>(
    const std::string_view value) {
  return find_enum(value, kTransactionKindMappings);
}

template <>
inline std::optional<transaction_kind_t> try_from_code<transaction_kind_t>(
    const uint8_t code) {
  return find_enum(code, kTransactionKindCodes);
}

inline constexpr std::string_view to_string(const transaction_kind_t value) {
  return find_key(value, kTransactionKindMappings).value_or("unknown");
}

inline constexpr uint8_t to_code(const transaction_kind_t value) {
  return find_key(value, kTransactionKindCodes).value_or(uint8_t{0xFF});
}

}  // namespace ypbank::schema
