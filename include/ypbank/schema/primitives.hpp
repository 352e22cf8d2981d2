#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ypbank::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using tx_id_t = uint64_t;
using account_id_t = uint64_t;
using amount_t = int64_t;  // Minor currency units.
using timestamp_milliseconds_t = uint64_t;

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_view_t& bytes);

/// Uppercase hex dump without separators, e.g. "5950424E".
std::string to_hex(const bytes_view_t& bytes);

/// Strict UTF-8 check: rejects overlong forms, surrogates and code points
/// above U+10FFFF.
bool is_valid_utf8(const bytes_view_t& bytes);
bool is_valid_utf8(const std::string_view& text);

/// Strip leading and trailing ASCII whitespace.
std::string_view trim(std::string_view text);

}  // namespace ypbank::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
