#pragma once

#include <boost/container_hash/hash.hpp>
#include <ypbank/schema/primitives.hpp>
#include <ypbank/schema/transaction_kind.hpp>
#include <ypbank/schema/transaction_status.hpp>

#include <cstddef>
#include <functional>
#include <string>

namespace ypbank::schema {

/// One financial transaction as carried by every file format.
///
/// Equality covers every field, so two records that differ only in
/// `timestamp` are distinct. Kind is not cross-checked against `from`/`to`
/// or the sign of `amount`.
struct tx_record final {
  tx_id_t id{};
  transaction_kind_t kind{transaction_kind_t::deposit};
  account_id_t from{};
  account_id_t to{};
  amount_t amount{};
  timestamp_milliseconds_t timestamp{};
  transaction_status_t status{transaction_status_t::success};
  std::string description;

  bool operator==(const tx_record&) const = default;
};

using tx_record_t = tx_record;

}  // namespace ypbank::schema

namespace std {

template <>
struct hash<ypbank::schema::tx_record_t> {
  std::size_t operator()(
      const ypbank::schema::tx_record_t& record) const noexcept {
    auto seed = std::size_t{0};
    boost::hash_combine(seed, record.id);
    boost::hash_combine(seed, static_cast<uint8_t>(record.kind));
    boost::hash_combine(seed, record.from);
    boost::hash_combine(seed, record.to);
    boost::hash_combine(seed, record.amount);
    boost::hash_combine(seed, record.timestamp);
    boost::hash_combine(seed, static_cast<uint8_t>(record.status));
    boost::hash_combine(seed, record.description);
    return seed;
  }
};

}  // namespace std
