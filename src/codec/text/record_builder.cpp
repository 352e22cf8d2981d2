#include <ypbank/codec/error.hpp>
#include <ypbank/codec/text/record_builder.hpp>
#include <ypbank/codec/value_parser.hpp>

#include <utility>

using namespace ypbank::schema;

namespace {

constexpr auto kFieldDelimiter = ':';

template <typename T>
T take(std::optional<T>& slot, const field_key_t field) {
  if (!slot) {
    throw ypbank::codec::parser_error{
        ypbank::codec::parser_error_code::missing_field, field};
  }
  return std::move(*slot);
}

}  // namespace

namespace ypbank::codec::text {

bool record_builder::contains(const field_key_t field) const noexcept {
  switch (field) {
    case field_key_t::id:
      return id_.has_value();
    case field_key_t::kind:
      return kind_.has_value();
    case field_key_t::from:
      return from_.has_value();
    case field_key_t::to:
      return to_.has_value();
    case field_key_t::amount:
      return amount_.has_value();
    case field_key_t::timestamp:
      return timestamp_.has_value();
    case field_key_t::status:
      return status_.has_value();
    case field_key_t::description:
      return description_.has_value();
  }
  return false;
}

void record_builder::set(const field_key_t field, const std::string_view value) {
  if (contains(field)) {
    throw parser_error{parser_error_code::duplicate, field};
  }
  dirty_ = true;
  switch (field) {
    case field_key_t::id:
      id_ = parse_tx_id(value);
      break;
    case field_key_t::kind:
      kind_ = parse_transaction_kind(value);
      break;
    case field_key_t::from:
      from_ = parse_account_id(value);
      break;
    case field_key_t::to:
      to_ = parse_account_id(value);
      break;
    case field_key_t::amount:
      amount_ = parse_amount(value);
      break;
    case field_key_t::timestamp:
      timestamp_ = parse_timestamp(value);
      break;
    case field_key_t::status:
      status_ = parse_transaction_status(value);
      break;
    case field_key_t::description:
      description_ = std::string{unquote(value)};
      break;
  }
}

void record_builder::set_from_line(const std::string_view line) {
  auto delimiter = line.find(kFieldDelimiter);
  if (delimiter == std::string_view::npos) {
    throw parser_error{parser_error_code::no_field_delimiter};
  }
  auto key = trim(line.substr(0, delimiter));
  auto field = try_from_string<field_key_t>(key);
  if (!field) {
    throw parser_error{parser_error_code::unparsable_key, std::string{key}};
  }
  set(*field, trim(line.substr(delimiter + 1)));
}

tx_record_t record_builder::finalize() {
  auto record = tx_record_t{};
  record.id = take(id_, field_key_t::id);
  record.kind = take(kind_, field_key_t::kind);
  record.from = take(from_, field_key_t::from);
  record.to = take(to_, field_key_t::to);
  record.amount = take(amount_, field_key_t::amount);
  record.timestamp = take(timestamp_, field_key_t::timestamp);
  record.status = take(status_, field_key_t::status);
  record.description = take(description_, field_key_t::description);
  reset();
  return record;
}

void record_builder::reset() {
  *this = record_builder{};
}

}  // namespace ypbank::codec::text
