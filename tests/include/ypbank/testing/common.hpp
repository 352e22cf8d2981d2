#pragma once

#include <ypbank/codec/codec.hpp>
#include <ypbank/codec/error.hpp>
#include <ypbank/schema/transaction_record.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ypbank::schema {

// gtest printer, found by ADL.
inline void PrintTo(const tx_record_t& record, std::ostream* os) {
  *os << "{id=" << record.id << ", kind=" << to_string(record.kind)
      << ", from=" << record.from << ", to=" << record.to
      << ", amount=" << record.amount << ", timestamp=" << record.timestamp
      << ", status=" << to_string(record.status) << ", description=\""
      << record.description << "\"}";
}

}  // namespace ypbank::schema

namespace ypbank::testing {

inline ypbank::schema::tx_record_t make_record(const uint64_t seed) {
  auto record = ypbank::schema::tx_record_t{};
  record.id = seed;
  record.kind = static_cast<ypbank::schema::transaction_kind_t>(seed % 3);
  record.from = 1000 + seed;
  record.to = 2000 + seed;
  record.amount = static_cast<int64_t>(seed * 100) - 250;
  record.timestamp = 1'700'000'000'000 + seed;
  record.status = static_cast<ypbank::schema::transaction_status_t>(seed % 3);
  record.description = "payment #" + std::to_string(seed);
  return record;
}

inline std::vector<ypbank::schema::tx_record_t> make_records(
    const uint64_t count) {
  auto records = std::vector<ypbank::schema::tx_record_t>{};
  for (uint64_t i = 1; i <= count; ++i) {
    records.push_back(make_record(i));
  }
  return records;
}

template <typename Format>
std::string write_to_string(
    const std::vector<ypbank::schema::tx_record_t>& records) {
  auto output = std::ostringstream{};
  ypbank::codec::codec<Format>{}.write(output, records);
  return output.str();
}

template <typename Format>
std::vector<ypbank::schema::tx_record_t> parse_from_string(
    const std::string_view input) {
  auto stream = std::istringstream{std::string{input}};
  return ypbank::codec::codec<Format>{}.parse(stream);
}

/// Parse and return the raised app_error; fails the test when none is raised.
template <typename Format>
ypbank::codec::app_error parse_error_from_string(const std::string_view input) {
  try {
    parse_from_string<Format>(input);
  } catch (const ypbank::codec::app_error& error) {
    return error;
  }
  throw std::logic_error{"expected app_error was not raised"};
}

inline std::optional<ypbank::codec::parser_error_code> cause_code(
    const ypbank::codec::app_error& error) {
  if (!error.cause()) {
    return std::nullopt;
  }
  return error.cause()->code();
}

}  // namespace ypbank::testing
