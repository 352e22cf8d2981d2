#pragma once

#include <ypbank/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: transaction status.
namespace ypbank::schema {

enum class transaction_status_t : uint8_t {
  success = 0,
  failure = 1,
  pending = 2
};

inline constexpr auto kTransactionStatusMappings =
    token_mappings_t<transaction_status_t, 3>{
        std::pair<std::string_view, transaction_status_t>{
            "SUCCESS", transaction_status_t::success},
        std::pair<std::string_view, transaction_status_t>{
            "FAILURE", transaction_status_t::failure},
        std::pair<std::string_view, transaction_status_t>{
            "PENDING", transaction_status_t::pending}};

inline constexpr auto kTransactionStatusCodes =
    code_mappings_t<transaction_status_t, 3>{
        std::pair<uint8_t, transaction_status_t>{
            0, transaction_status_t::success},
        std::pair<uint8_t, transaction_status_t>{
            1, transaction_status_t::failure},
        std::pair<uint8_t, transaction_status_t>{
            2, transaction_status_t::pending}};

template <>
inline std::optional<transaction_status_t>
try_from_string<transaction_status_t>(const std::string_view value) {
  return find_enum(value, kTransactionStatusMappings);
}

template <>
inline std::optional<transaction_status_t>
try_from_code<transaction_status_t>(const uint8_t code) {
  return find_enum(code, kTransactionStatusCodes);
}

inline constexpr std::string_view to_string(const transaction_status_t value) {
  return find_key(value, kTransactionStatusMappings).value_or("unknown");
}

inline constexpr uint8_t to_code(const transaction_status_t value) {
  return find_key(value, kTransactionStatusCodes).value_or(uint8_t{0xFF});
}

}  // namespace ypbank::schema
