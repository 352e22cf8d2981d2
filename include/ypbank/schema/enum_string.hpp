#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace ypbank::schema {

template <typename Enum, std::size_t N>
using token_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
using code_mappings_t = std::array<std::pair<uint8_t, Enum>, N>;

template <typename Key, typename Enum, std::size_t N>
constexpr std::optional<Enum> find_enum(
    const Key key,
    const std::array<std::pair<Key, Enum>, N>& mappings) {
  for (const auto& [mapped_key, enum_value] : mappings) {
    if (mapped_key == key) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Key, typename Enum, std::size_t N>
constexpr std::optional<Key> find_key(
    const Enum value,
    const std::array<std::pair<Key, Enum>, N>& mappings) {
  for (const auto& [mapped_key, enum_value] : mappings) {
    if (enum_value == value) {
      return mapped_key;
    }
  }
  return std::nullopt;
}

// Exact, case-sensitive token lookup. Specialized per enum next to its
// mapping table.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

// Binary wire code lookup. Specialized per enum that has a byte encoding.
template <typename Enum>
std::optional<Enum> try_from_code(const uint8_t code) {
  static_cast<void>(code);
  return std::nullopt;
}

}  // namespace ypbank::schema
