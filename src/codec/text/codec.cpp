#include <spdlog/spdlog.h>
#include <ypbank/codec/error.hpp>
#include <ypbank/codec/io.hpp>
#include <ypbank/codec/text/codec.hpp>
#include <ypbank/codec/text/record_builder.hpp>
#include <ypbank/codec/value_parser.hpp>

#include <string>

using namespace ypbank::schema;

namespace {

constexpr auto kCommentMarker = '#';

void write_field(std::ostream& output,
                 const field_key_t field,
                 const std::string_view value) {
  auto line = std::string{to_string(field)};
  line.append(": ");
  line.append(value);
  ypbank::codec::io::write_line(output, line);
}

}  // namespace

namespace ypbank::codec {

std::vector<tx_record_t> codec<text_format_tag>::parse(
    std::istream& input) const {
  auto records = std::vector<tx_record_t>{};
  auto builder = text::record_builder{};
  auto line_number = std::size_t{0};
  auto raw_line = std::string{};
  auto next_line = std::string{};

  auto close_record = [&]() {
    if (!builder.dirty()) {
      return;
    }
    try {
      records.push_back(builder.finalize());
    } catch (const parser_error& error) {
      throw app_error{error, line_context_t{.line_number = line_number,
                                            .line = raw_line}};
    }
  };

  // raw_line keeps the last line read so end-of-input errors can quote it.
  while (io::read_line(input, next_line)) {
    raw_line.swap(next_line);
    ++line_number;
    auto line = trim(raw_line);
    if (!line.empty() && line.front() == kCommentMarker) {
      continue;
    }
    if (line.empty()) {
      close_record();
      continue;
    }
    try {
      builder.set_from_line(line);
    } catch (const parser_error& error) {
      throw app_error{error, line_context_t{.line_number = line_number,
                                            .line = raw_line}};
    }
  }
  close_record();

  spdlog::debug("Parsed {} record(s) from text input ({} lines)",
                records.size(), line_number);
  return records;
}

void codec<text_format_tag>::write(
    std::ostream& output,
    const std::vector<tx_record_t>& records) const {
  for (const auto& record : records) {
    write_field(output, field_key_t::id, std::to_string(record.id));
    write_field(output, field_key_t::kind, schema::to_string(record.kind));
    write_field(output, field_key_t::from, std::to_string(record.from));
    write_field(output, field_key_t::to, std::to_string(record.to));
    write_field(output, field_key_t::amount, std::to_string(record.amount));
    write_field(output, field_key_t::timestamp,
                std::to_string(record.timestamp));
    write_field(output, field_key_t::status, schema::to_string(record.status));
    write_field(output, field_key_t::description, quote(record.description));
    io::write_line(output, {});
  }
  spdlog::debug("Wrote {} record(s) as text", records.size());
}

}  // namespace ypbank::codec
