#include <boost/endian/conversion.hpp>
#include <spdlog/spdlog.h>
#include <ypbank/codec/binary/codec.hpp>
#include <ypbank/codec/binary/frame_builder.hpp>
#include <ypbank/codec/error.hpp>
#include <ypbank/codec/io.hpp>

#include <string>

using namespace ypbank::schema;

namespace {

using ypbank::codec::app_error;
using ypbank::codec::parser_error;
using ypbank::codec::parser_error_code;
using ypbank::codec::position_context_t;
using ypbank::codec::position_field_context_t;

// Sequential decoder over one frame body. Offsets are absolute stream
// positions so errors point into the original input.
class body_reader final {
 public:
  body_reader(const bytes_view_t& body, const std::size_t base_offset)
      : body_(body), base_offset_(base_offset) {}

  std::size_t position() const { return base_offset_ + cursor_; }
  std::size_t remaining() const { return body_.size() - cursor_; }

  uint8_t read_u8() { return body_[cursor_++]; }

  uint32_t read_u32() {
    auto value = boost::endian::load_big_u32(body_.data() + cursor_);
    cursor_ += sizeof(value);
    return value;
  }

  uint64_t read_u64() {
    auto value = boost::endian::load_big_u64(body_.data() + cursor_);
    cursor_ += sizeof(value);
    return value;
  }

  int64_t read_i64() {
    auto value = boost::endian::load_big_s64(body_.data() + cursor_);
    cursor_ += sizeof(value);
    return value;
  }

  bytes_view_t read_bytes(const std::size_t size) {
    auto bytes = body_.subspan(cursor_, size);
    cursor_ += size;
    return bytes;
  }

 private:
  bytes_view_t body_;
  std::size_t base_offset_{};
  std::size_t cursor_{};
};

template <typename Enum>
Enum decode_enum(body_reader& reader, const field_key_t field) {
  auto position = reader.position();
  auto code = reader.read_u8();
  auto value = try_from_code<Enum>(code);
  if (!value) {
    throw app_error{
        parser_error{parser_error_code::unparsable_value, std::to_string(code)},
        position_field_context_t{.position = position, .field = field}};
  }
  return *value;
}

std::string decode_description(body_reader& reader) {
  auto length_position = reader.position();
  auto length = reader.read_u32();
  if (length > reader.remaining()) {
    throw app_error{
        parser_error{parser_error_code::incomplete_record},
        position_field_context_t{.position = length_position,
                                 .field = field_key_t::description}};
  }
  auto position = reader.position();
  auto bytes = reader.read_bytes(length);
  if (!is_valid_utf8(bytes)) {
    throw app_error{
        parser_error{parser_error_code::unparsable_value, "non utf-8 string"},
        position_field_context_t{.position = position,
                                 .field = field_key_t::description}};
  }
  return make_string(bytes);
}

tx_record_t decode_body(const bytes_view_t& body, const std::size_t offset) {
  auto reader = body_reader{body, offset};
  auto record = tx_record_t{};
  record.id = reader.read_u64();
  record.kind = decode_enum<transaction_kind_t>(reader, field_key_t::kind);
  record.from = reader.read_u64();
  record.to = reader.read_u64();
  record.amount = reader.read_i64();
  record.timestamp = reader.read_u64();
  record.status = decode_enum<transaction_status_t>(reader, field_key_t::status);
  record.description = decode_description(reader);
  if (reader.remaining() > 0) {
    spdlog::debug("Skipping {} trailing byte(s) in frame at offset {}",
                  reader.remaining(), offset);
  }
  return record;
}

}  // namespace

namespace ypbank::codec {

void binary::check_frameable(const tx_record_t& record,
                             const uint64_t max_description_size) {
  if (record.description.size() > max_description_size) {
    throw app_error::write_failure(
        "description of transaction " + std::to_string(record.id) +
        " exceeds u32 length (" + std::to_string(record.description.size()) +
        " bytes)");
  }
}

std::vector<tx_record_t> codec<binary_format_tag>::parse(
    std::istream& input) const {
  auto records = std::vector<tx_record_t>{};
  auto position = std::size_t{0};

  while (true) {
    auto frame_start = position;
    auto magic = std::array<uint8_t, 4>{};
    auto read = io::read_some(input, magic.data(), magic.size());
    if (read == 0) {
      break;
    }
    if (read != magic.size()) {
      throw app_error::read_failure("stream ended inside a record header");
    }
    position += magic.size();
    if (magic != binary::kRecordMagic) {
      throw app_error{parser_error{parser_error_code::invalid_record_header,
                                   to_hex(bytes_view_t{magic})},
                      position_context_t{.position = frame_start}};
    }

    auto length_bytes = std::array<uint8_t, 4>{};
    io::read_exact(input, length_bytes.data(), length_bytes.size());
    position += length_bytes.size();
    auto body_size = boost::endian::load_big_u32(length_bytes.data());
    if (body_size < binary::kFixedBodySize) {
      throw app_error{parser_error{parser_error_code::incomplete_record},
                      position_context_t{.position = position}};
    }

    auto body = io::read_exact(input, body_size);
    records.push_back(decode_body(make_bytes_view(body), position));
    position += body.size();
  }

  spdlog::debug("Parsed {} record(s) from binary input ({} bytes)",
                records.size(), position);
  return records;
}

void codec<binary_format_tag>::write(
    std::ostream& output,
    const std::vector<tx_record_t>& records) const {
  for (const auto& record : records) {
    binary::check_frameable(record);
    auto description_size = static_cast<uint32_t>(record.description.size());

    auto frame = binary::frame_builder{};
    frame.data.reserve(binary::kRecordMagic.size() + sizeof(uint32_t) +
                       binary::kFixedBodySize + description_size);
    frame.write(std::span<const uint8_t>{binary::kRecordMagic})
        .write(binary::kFixedBodySize + description_size)
        .write(record.id)
        .write(to_code(record.kind))
        .write(record.from)
        .write(record.to)
        .write(record.amount)
        .write(record.timestamp)
        .write(to_code(record.status))
        .write(description_size)
        .write(std::string_view{record.description});
    io::write_all(output, make_bytes_view(frame.data));
  }

  spdlog::debug("Wrote {} record(s) as binary frames", records.size());
}

}  // namespace ypbank::codec
