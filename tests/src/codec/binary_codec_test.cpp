#include <gtest/gtest.h>
#include <ypbank/codec/binary/codec.hpp>
#include <ypbank/testing/common.hpp>

#include <cstdint>
#include <sstream>
#include <string>
#include <variant>

namespace {

using binary_codec_t = ypbank::codec::codec<ypbank::codec::binary_format_tag>;
using ypbank::codec::app_error_kind;
using ypbank::codec::parser_error_code;
using ypbank::schema::field_key_t;
using ypbank::schema::transaction_kind_t;
using ypbank::schema::transaction_status_t;
using ypbank::schema::tx_record_t;
using ypbank::testing::cause_code;
using ypbank::testing::make_record;
using ypbank::testing::make_records;

using binary_tag = ypbank::codec::binary_format_tag;

// Offsets inside a single frame.
constexpr auto kLengthOffset = std::size_t{4};
constexpr auto kKindOffset = std::size_t{16};
constexpr auto kStatusOffset = std::size_t{49};
constexpr auto kDescriptionLengthOffset = std::size_t{50};
constexpr auto kDescriptionOffset = std::size_t{54};

tx_record_t make_payment() {
  return tx_record_t{.id = 1,
                     .kind = transaction_kind_t::transfer,
                     .from = 11,
                     .to = 22,
                     .amount = -500,
                     .timestamp = 1'700'000,
                     .status = transaction_status_t::pending,
                     .description = "payment"};
}

std::string write_frames(const std::vector<tx_record_t>& records) {
  return ypbank::testing::write_to_string<binary_tag>(records);
}

void set_u32(std::string& frame, const std::size_t offset, const uint32_t value) {
  frame[offset] = static_cast<char>((value >> 24u) & 0xFFu);
  frame[offset + 1] = static_cast<char>((value >> 16u) & 0xFFu);
  frame[offset + 2] = static_cast<char>((value >> 8u) & 0xFFu);
  frame[offset + 3] = static_cast<char>(value & 0xFFu);
}

}  // namespace

TEST(binary_codec, payment_round_trips) {
  auto record = make_payment();
  auto encoded = write_frames({record});
  auto decoded =
      ypbank::testing::parse_from_string<binary_tag>(encoded);
  ASSERT_EQ(decoded.size(), 1u);
  EXPECT_EQ(decoded[0], record);
}

TEST(binary_codec, write_produces_big_endian_frame) {
  auto encoded = write_frames({make_payment()});
  auto expected = std::string{
      "YPBN"
      "\x00\x00\x00\x35"                  // body length 46 + 7
      "\x00\x00\x00\x00\x00\x00\x00\x01"  // id
      "\x01"                              // TRANSFER
      "\x00\x00\x00\x00\x00\x00\x00\x0B"  // from
      "\x00\x00\x00\x00\x00\x00\x00\x16"  // to
      "\xFF\xFF\xFF\xFF\xFF\xFF\xFE\x0C"  // -500
      "\x00\x00\x00\x00\x00\x19\xF0\xA0"  // 1700000
      "\x02"                              // PENDING
      "\x00\x00\x00\x07"
      "payment",
      4 + 4 + 46 + 7};
  EXPECT_EQ(encoded, expected);
}

TEST(binary_codec, sequence_round_trips_in_order) {
  auto records = make_records(6);
  records[2].description.clear();
  records[4].description = "перевод \xE2\x82\xAC";
  auto decoded =
      ypbank::testing::parse_from_string<binary_tag>(write_frames(records));
  EXPECT_EQ(decoded, records);
}

TEST(binary_codec, empty_input_parses_to_empty_sequence) {
  auto decoded = ypbank::testing::parse_from_string<binary_tag>("");
  EXPECT_TRUE(decoded.empty());
  EXPECT_TRUE(write_frames({}).empty());
}

TEST(binary_codec, truncated_body_is_read_error) {
  auto encoded = write_frames(make_records(2));
  encoded.pop_back();
  auto error = ypbank::testing::parse_error_from_string<binary_tag>(encoded);
  EXPECT_EQ(error.kind(), app_error_kind::read_error);
  EXPECT_FALSE(error.cause().has_value());
  EXPECT_FALSE(error.context().has_value());
}

TEST(binary_codec, partial_magic_is_read_error) {
  auto encoded = write_frames({make_record(1)});
  encoded.append("YP");
  auto error = ypbank::testing::parse_error_from_string<binary_tag>(encoded);
  EXPECT_EQ(error.kind(), app_error_kind::read_error);
}

TEST(binary_codec, truncated_length_is_read_error) {
  auto error =
      ypbank::testing::parse_error_from_string<binary_tag>(std::string{
          "YPBN\x00\x00", 6});
  EXPECT_EQ(error.kind(), app_error_kind::read_error);
}

TEST(binary_codec, bad_magic_reports_hex_at_frame_start) {
  auto first = write_frames({make_record(1)});
  auto second = write_frames({make_record(2)});
  second[0] = 'X';
  auto error =
      ypbank::testing::parse_error_from_string<binary_tag>(first + second);
  EXPECT_EQ(error.kind(), app_error_kind::parsing_error);
  EXPECT_EQ(cause_code(error), parser_error_code::invalid_record_header);
  EXPECT_EQ(error.cause()->detail(), "5850424E");
  ASSERT_TRUE(error.context().has_value());
  auto* context =
      std::get_if<ypbank::codec::position_context_t>(&*error.context());
  ASSERT_NE(context, nullptr);
  EXPECT_EQ(context->position, first.size());
}

TEST(binary_codec, body_length_below_minimum_is_incomplete_record) {
  auto record = make_payment();
  record.description.clear();
  auto encoded = write_frames({record});
  set_u32(encoded, kLengthOffset, 45);
  auto error = ypbank::testing::parse_error_from_string<binary_tag>(encoded);
  EXPECT_EQ(cause_code(error), parser_error_code::incomplete_record);
  auto* context =
      std::get_if<ypbank::codec::position_context_t>(&*error.context());
  ASSERT_NE(context, nullptr);
  EXPECT_EQ(context->position, kLengthOffset + 4);
}

TEST(binary_codec, minimum_body_length_holds_empty_description) {
  auto record = make_payment();
  record.description.clear();
  auto encoded = write_frames({record});
  ASSERT_EQ(encoded.size(), 4u + 4u + 46u);
  EXPECT_EQ(encoded.substr(kLengthOffset, 4),
            (std::string{"\x00\x00\x00\x2E", 4}));
  auto decoded = ypbank::testing::parse_from_string<binary_tag>(encoded);
  ASSERT_EQ(decoded.size(), 1u);
  EXPECT_EQ(decoded[0], record);
}

TEST(binary_codec, huge_declared_length_on_short_input_is_read_error) {
  auto error = ypbank::testing::parse_error_from_string<binary_tag>(
      std::string{"YPBN\xFF\xFF\xFF\xF0", 8});
  EXPECT_EQ(error.kind(), app_error_kind::read_error);
  EXPECT_FALSE(error.context().has_value());
  EXPECT_NE(std::string{error.what()}.find("expected 4294967280 bytes, got 0"),
            std::string::npos);
}

TEST(binary_codec, partial_body_reports_bytes_read) {
  auto encoded = write_frames({make_payment()});
  encoded.resize(encoded.size() - 5);
  auto error = ypbank::testing::parse_error_from_string<binary_tag>(encoded);
  EXPECT_EQ(error.kind(), app_error_kind::read_error);
  EXPECT_NE(std::string{error.what()}.find("expected 53 bytes, got 48"),
            std::string::npos);
}

TEST(binary_codec, unknown_kind_byte_is_unparsable_value) {
  auto encoded = write_frames({make_payment()});
  encoded[kKindOffset] = '\x03';
  auto error = ypbank::testing::parse_error_from_string<binary_tag>(encoded);
  EXPECT_EQ(cause_code(error), parser_error_code::unparsable_value);
  EXPECT_EQ(error.cause()->detail(), "3");
  auto* context =
      std::get_if<ypbank::codec::position_field_context_t>(&*error.context());
  ASSERT_NE(context, nullptr);
  EXPECT_EQ(context->position, kKindOffset);
  EXPECT_EQ(context->field, field_key_t::kind);
  EXPECT_NE(std::string{error.what()}.find(
                "position #16, field being parsed: `TX_TYPE`"),
            std::string::npos);
}

TEST(binary_codec, unknown_status_byte_is_unparsable_value) {
  auto encoded = write_frames({make_payment()});
  encoded[kStatusOffset] = '\xFF';
  auto error = ypbank::testing::parse_error_from_string<binary_tag>(encoded);
  EXPECT_EQ(cause_code(error), parser_error_code::unparsable_value);
  auto* context =
      std::get_if<ypbank::codec::position_field_context_t>(&*error.context());
  ASSERT_NE(context, nullptr);
  EXPECT_EQ(context->position, kStatusOffset);
  EXPECT_EQ(context->field, field_key_t::status);
}

TEST(binary_codec, non_utf8_description_is_unparsable_value) {
  auto encoded = write_frames({make_payment()});
  encoded[kDescriptionOffset] = '\xC3';
  encoded[kDescriptionOffset + 1] = '\x28';
  auto error = ypbank::testing::parse_error_from_string<binary_tag>(encoded);
  EXPECT_EQ(cause_code(error), parser_error_code::unparsable_value);
  auto* context =
      std::get_if<ypbank::codec::position_field_context_t>(&*error.context());
  ASSERT_NE(context, nullptr);
  EXPECT_EQ(context->position, kDescriptionOffset);
  EXPECT_EQ(context->field, field_key_t::description);
}

TEST(binary_codec, description_overrunning_body_is_incomplete_record) {
  auto encoded = write_frames({make_payment()});
  set_u32(encoded, kDescriptionLengthOffset, 8);
  auto error = ypbank::testing::parse_error_from_string<binary_tag>(encoded);
  EXPECT_EQ(cause_code(error), parser_error_code::incomplete_record);
  auto* context =
      std::get_if<ypbank::codec::position_field_context_t>(&*error.context());
  ASSERT_NE(context, nullptr);
  EXPECT_EQ(context->position, kDescriptionLengthOffset);
  EXPECT_EQ(context->field, field_key_t::description);
}

TEST(binary_codec, trailing_body_bytes_are_skipped) {
  auto record = make_payment();
  auto encoded = write_frames({record});
  set_u32(encoded, kLengthOffset, 46 + 7 + 3);
  encoded.append("xyz");
  encoded += write_frames({make_record(9)});
  auto decoded = ypbank::testing::parse_from_string<binary_tag>(encoded);
  ASSERT_EQ(decoded.size(), 2u);
  EXPECT_EQ(decoded[0], record);
  EXPECT_EQ(decoded[1], make_record(9));
}

TEST(binary_codec, oversized_description_is_write_error) {
  auto record = make_payment();
  EXPECT_NO_THROW(ypbank::codec::binary::check_frameable(record, 7));
  try {
    ypbank::codec::binary::check_frameable(record, 6);
    FAIL() << "expected write error";
  } catch (const ypbank::codec::app_error& error) {
    EXPECT_EQ(error.kind(), app_error_kind::write_error);
    EXPECT_FALSE(error.context().has_value());
    EXPECT_STREQ(error.what(),
                 "write error, description of transaction 1 exceeds u32 "
                 "length (7 bytes)");
  }
  EXPECT_EQ(ypbank::codec::binary::kMaxDescriptionSize,
            uint64_t{0xFFFFFFFFu} - 46u);
}

TEST(binary_codec, failing_output_stream_is_write_error) {
  auto output = std::ostringstream{};
  output.setstate(std::ios::badbit);
  try {
    binary_codec_t{}.write(output, {make_payment()});
    FAIL() << "expected write error";
  } catch (const ypbank::codec::app_error& error) {
    EXPECT_EQ(error.kind(), app_error_kind::write_error);
    EXPECT_FALSE(error.context().has_value());
  }
}
