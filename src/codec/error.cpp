#include <ypbank/codec/error.hpp>
#include <ypbank/schema/primitives.hpp>

#include <string>
#include <utility>

namespace ypbank::codec {

namespace {

std::string describe(const parser_error_code code,
                     const std::string& detail,
                     const std::optional<schema::field_key_t>& field) {
  auto field_name = field ? std::string{schema::to_string(*field)} : detail;
  switch (code) {
    case parser_error_code::missing_field:
      return "required field " + field_name + " is missing";
    case parser_error_code::unparsable_key:
      return "unknown key " + detail;
    case parser_error_code::unparsable_value:
      return "value " + detail + " can't be parsed";
    case parser_error_code::duplicate:
      return "field " + field_name + " has duplicate";
    case parser_error_code::no_field_delimiter:
      return "key-value delimiter is expected";
    case parser_error_code::shall_be_quoted:
      return "string ->" + detail + "<- shall be double quoted";
    case parser_error_code::invalid_file_header:
      return "invalid file header";
    case parser_error_code::invalid_record_header:
      return "invalid record header " + detail;
    case parser_error_code::incomplete_record:
      return "incomplete record (doesn't have all required fields)";
  }
  return "unknown parser error";
}

}  // namespace

std::string_view to_string(const parser_error_code code) {
  switch (code) {
    case parser_error_code::missing_field:
      return "missing_field";
    case parser_error_code::unparsable_key:
      return "unparsable_key";
    case parser_error_code::unparsable_value:
      return "unparsable_value";
    case parser_error_code::duplicate:
      return "duplicate";
    case parser_error_code::no_field_delimiter:
      return "no_field_delimiter";
    case parser_error_code::shall_be_quoted:
      return "shall_be_quoted";
    case parser_error_code::invalid_file_header:
      return "invalid_file_header";
    case parser_error_code::invalid_record_header:
      return "invalid_record_header";
    case parser_error_code::incomplete_record:
      return "incomplete_record";
  }
  return "unknown";
}

parser_error::parser_error(const parser_error_code code)
    : parser_error(code, std::string{}) {}

parser_error::parser_error(const parser_error_code code, std::string detail)
    : std::runtime_error(describe(code, detail, std::nullopt)),
      code_(code),
      detail_(std::move(detail)) {}

parser_error::parser_error(const parser_error_code code,
                           const schema::field_key_t field)
    : std::runtime_error(describe(code, std::string{}, field)),
      code_(code),
      detail_(schema::to_string(field)),
      field_(field) {}

std::string to_string(const parser_context_t& context) {
  return std::visit(
      overloaded{[](const line_context_t& arg) {
                   return "line #" + std::to_string(arg.line_number) +
                          ", content: `" + arg.line + "`";
                 },
                 [](const position_context_t& arg) {
                   return "position #" + std::to_string(arg.position);
                 },
                 [](const position_field_context_t& arg) {
                   return "position #" + std::to_string(arg.position) +
                          ", field being parsed: `" +
                          std::string{schema::to_string(arg.field)} + "`";
                 }},
      context);
}

app_error::app_error(const parser_error& cause, parser_context_t context)
    : std::runtime_error(std::string{cause.what()} + ":\n" +
                         to_string(context)),
      kind_(app_error_kind::parsing_error),
      cause_(cause),
      context_(std::move(context)) {}

app_error::app_error(const app_error_kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

app_error app_error::read_failure(const std::string_view detail) {
  return app_error{app_error_kind::read_error,
                   "read error, " + std::string{detail}};
}

app_error app_error::write_failure(const std::string_view detail) {
  return app_error{app_error_kind::write_error,
                   "write error, " + std::string{detail}};
}

}  // namespace ypbank::codec
