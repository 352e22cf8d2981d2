#pragma once

#include <ypbank/schema/field_key.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace ypbank::codec {

enum class parser_error_code : uint8_t {
  missing_field = 1,
  unparsable_key = 2,
  unparsable_value = 3,
  duplicate = 4,
  no_field_delimiter = 5,
  shall_be_quoted = 6,
  invalid_file_header = 7,
  invalid_record_header = 8,
  incomplete_record = 9,
};

std::string_view to_string(parser_error_code code);

/// Domain failure before it is located in a stream.
///
/// Raised by value parsers, the text record builder and the CSV row parser;
/// codecs catch it and rethrow as app_error with a parser_context_t.
class parser_error final : public std::runtime_error {
 public:
  explicit parser_error(parser_error_code code);
  parser_error(parser_error_code code, std::string detail);
  parser_error(parser_error_code code, schema::field_key_t field);

  parser_error_code code() const noexcept { return code_; }
  const std::string& detail() const noexcept { return detail_; }
  std::optional<schema::field_key_t> field() const noexcept { return field_; }

 private:
  parser_error_code code_;
  std::string detail_;
  std::optional<schema::field_key_t> field_;
};

/// Line-oriented formats: 1-based line number and the raw line.
struct line_context_t final {
  std::size_t line_number{};
  std::string line;
};

/// Binary format: absolute byte offset in the input stream.
struct position_context_t final {
  std::size_t position{};
};

/// Binary format: byte offset plus the field being decoded there.
struct position_field_context_t final {
  std::size_t position{};
  schema::field_key_t field{};
};

using parser_context_t = std::
    variant<line_context_t, position_context_t, position_field_context_t>;

std::string to_string(const parser_context_t& context);

enum class app_error_kind : uint8_t {
  read_error = 0,
  write_error = 1,
  parsing_error = 2,
};

/// Error surfaced by every codec operation.
///
/// Transport failures carry only a message. Parsing failures always carry the
/// parser_error and the location it was found at.
class app_error final : public std::runtime_error {
 public:
  app_error(const parser_error& cause, parser_context_t context);

  static app_error read_failure(std::string_view detail);
  static app_error write_failure(std::string_view detail);

  app_error_kind kind() const noexcept { return kind_; }
  const std::optional<parser_error>& cause() const noexcept { return cause_; }
  const std::optional<parser_context_t>& context() const noexcept {
    return context_;
  }

 private:
  app_error(app_error_kind kind, const std::string& message);

  app_error_kind kind_;
  std::optional<parser_error> cause_;
  std::optional<parser_context_t> context_;
};

}  // namespace ypbank::codec
