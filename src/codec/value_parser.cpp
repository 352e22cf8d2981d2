#include <ypbank/codec/error.hpp>
#include <ypbank/codec/value_parser.hpp>

#include <charconv>
#include <string>
#include <system_error>

namespace ypbank::codec {

namespace {

template <typename Integer>
Integer parse_integer(const std::string_view value) {
  auto result = Integer{};
  const auto* first = value.data();
  // One leading '+' is accepted ahead of a digit.
  if (value.size() > 1 && value.front() == '+' &&
      value[1] >= '0' && value[1] <= '9') {
    ++first;
  }
  const auto* last = value.data() + value.size();
  auto [end, error] = std::from_chars(first, last, result);
  if (value.empty() || error != std::errc{} || end != last) {
    throw parser_error{parser_error_code::unparsable_value,
                       std::string{value}};
  }
  return result;
}

}  // namespace

schema::tx_id_t parse_tx_id(const std::string_view value) {
  return parse_integer<schema::tx_id_t>(value);
}

schema::account_id_t parse_account_id(const std::string_view value) {
  return parse_integer<schema::account_id_t>(value);
}

schema::amount_t parse_amount(const std::string_view value) {
  return parse_integer<schema::amount_t>(value);
}

schema::timestamp_milliseconds_t parse_timestamp(const std::string_view value) {
  return parse_integer<schema::timestamp_milliseconds_t>(value);
}

schema::transaction_kind_t parse_transaction_kind(
    const std::string_view value) {
  auto kind = schema::try_from_string<schema::transaction_kind_t>(value);
  if (!kind) {
    throw parser_error{parser_error_code::unparsable_value,
                       std::string{value}};
  }
  return *kind;
}

schema::transaction_status_t parse_transaction_status(
    const std::string_view value) {
  auto status = schema::try_from_string<schema::transaction_status_t>(value);
  if (!status) {
    throw parser_error{parser_error_code::unparsable_value,
                       std::string{value}};
  }
  return *status;
}

std::string_view unquote(std::string_view value) {
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    throw parser_error{parser_error_code::shall_be_quoted, std::string{value}};
  }
  value.remove_prefix(1);
  value.remove_suffix(1);
  return value;
}

std::string quote(const std::string_view value) {
  auto out = std::string{};
  out.reserve(value.size() + 2);
  out.push_back('"');
  out.append(value);
  out.push_back('"');
  return out;
}

}  // namespace ypbank::codec
