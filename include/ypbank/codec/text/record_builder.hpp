#pragma once
#include <ypbank/schema/field_key.hpp>
#include <ypbank/schema/transaction_record.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace ypbank::codec::text {

/// Collects the fields of one text record in any order.
///
/// Each key may be set once per record. `finalize` checks presence in the
/// canonical field order and resets the builder for the next record.
class record_builder final {
 public:
  /// True once any field has been set since the last reset.
  bool dirty() const noexcept { return dirty_; }

  bool contains(schema::field_key_t field) const noexcept;

  /// Parse and store one value. Throws parser_error on duplicate or bad value.
  void set(schema::field_key_t field, std::string_view value);

  /// Parse a `KEY: value` line and store it.
  void set_from_line(std::string_view line);

  /// Build the record; missing_field for the first absent field.
  schema::tx_record_t finalize();

  void reset();

 private:
  bool dirty_{};
  std::optional<schema::tx_id_t> id_;
  std::optional<schema::transaction_kind_t> kind_;
  std::optional<schema::account_id_t> from_;
  std::optional<schema::account_id_t> to_;
  std::optional<schema::amount_t> amount_;
  std::optional<schema::timestamp_milliseconds_t> timestamp_;
  std::optional<schema::transaction_status_t> status_;
  std::optional<std::string> description_;
};

}  // namespace ypbank::codec::text
