#include <boost/algorithm/string/join.hpp>
#include <spdlog/spdlog.h>
#include <ypbank/codec/csv/codec.hpp>
#include <ypbank/codec/error.hpp>
#include <ypbank/codec/io.hpp>
#include <ypbank/codec/value_parser.hpp>

#include <array>
#include <string>
#include <vector>

using namespace ypbank::schema;

namespace {

// Split on every delimiter and trim each token. Returns the token count,
// which may exceed kFieldCount; only the first kFieldCount tokens are kept.
std::size_t split_row(const std::string_view line,
                      std::array<std::string_view, kFieldCount>& tokens) {
  auto count = std::size_t{0};
  auto start = std::size_t{0};
  while (true) {
    auto end = line.find(ypbank::codec::csv::kDelimiter, start);
    auto token = line.substr(
        start, end == std::string_view::npos ? std::string_view::npos
                                             : end - start);
    if (count < tokens.size()) {
      tokens[count] = trim(token);
    }
    ++count;
    if (end == std::string_view::npos) {
      return count;
    }
    start = end + 1;
  }
}

constexpr auto column(const field_key_t field) {
  return static_cast<std::size_t>(field);
}

}  // namespace

namespace ypbank::codec {

namespace csv {

tx_record_t parse_row(const std::string_view line) {
  auto tokens = std::array<std::string_view, kFieldCount>{};
  if (split_row(line, tokens) != kFieldCount) {
    throw parser_error{parser_error_code::incomplete_record};
  }

  auto record = tx_record_t{};
  record.id = parse_tx_id(tokens[column(field_key_t::id)]);
  record.kind = parse_transaction_kind(tokens[column(field_key_t::kind)]);
  record.from = parse_account_id(tokens[column(field_key_t::from)]);
  record.to = parse_account_id(tokens[column(field_key_t::to)]);
  record.amount = parse_amount(tokens[column(field_key_t::amount)]);
  record.timestamp = parse_timestamp(tokens[column(field_key_t::timestamp)]);
  record.status = parse_transaction_status(tokens[column(field_key_t::status)]);
  record.description =
      std::string{unquote(tokens[column(field_key_t::description)])};
  return record;
}

std::string format_row(const tx_record_t& record) {
  auto values = std::vector<std::string>{};
  values.reserve(kFieldCount);
  values.push_back(std::to_string(record.id));
  values.emplace_back(schema::to_string(record.kind));
  values.push_back(std::to_string(record.from));
  values.push_back(std::to_string(record.to));
  values.push_back(std::to_string(record.amount));
  values.push_back(std::to_string(record.timestamp));
  values.emplace_back(schema::to_string(record.status));
  values.push_back(quote(record.description));
  return boost::algorithm::join(values, std::string{kDelimiter});
}

}  // namespace csv

std::vector<tx_record_t> codec<csv_format_tag>::parse(
    std::istream& input) const {
  auto records = std::vector<tx_record_t>{};
  auto line = std::string{};
  auto line_number = std::size_t{0};

  if (!io::read_line(input, line)) {
    spdlog::debug("CSV input is empty");
    return records;
  }
  ++line_number;
  if (line != csv::kHeader) {
    throw app_error{parser_error{parser_error_code::invalid_file_header},
                    line_context_t{.line_number = line_number, .line = line}};
  }

  while (io::read_line(input, line)) {
    ++line_number;
    try {
      records.push_back(csv::parse_row(trim(line)));
    } catch (const parser_error& error) {
      throw app_error{error,
                      line_context_t{.line_number = line_number, .line = line}};
    }
  }

  spdlog::debug("Parsed {} record(s) from CSV input", records.size());
  return records;
}

void codec<csv_format_tag>::write(
    std::ostream& output,
    const std::vector<tx_record_t>& records) const {
  io::write_line(output, csv::kHeader);
  for (const auto& record : records) {
    io::write_line(output, csv::format_row(record));
  }
  spdlog::debug("Wrote {} record(s) as CSV", records.size());
}

}  // namespace ypbank::codec
