#pragma once
#include <ypbank/codec/codec.hpp>

#include <array>
#include <cstdint>
#include <limits>

namespace ypbank::codec {

struct binary_format_tag {};

namespace binary {

inline constexpr auto kRecordMagic = std::array<uint8_t, 4>{'Y', 'P', 'B', 'N'};

// Body bytes that precede the description: id, kind, from, to, amount,
// timestamp, status and the description length.
inline constexpr auto kFixedBodySize = uint32_t{8 + 1 + 8 + 8 + 8 + 8 + 1 + 4};

// Longest description whose frame length still fits the u32 length field.
inline constexpr auto kMaxDescriptionSize =
    uint64_t{std::numeric_limits<uint32_t>::max() - kFixedBodySize};

/// Raise a write failure when the description of `record` is longer than
/// `max_description_size` bytes.
void check_frameable(const schema::tx_record_t& record,
                     uint64_t max_description_size = kMaxDescriptionSize);

}  // namespace binary

// Frame: magic, u32 body length, then the body. All integers big-endian.
template <>
struct codec<binary_format_tag> final {
  std::vector<schema::tx_record_t> parse(std::istream& input) const;

  void write(std::ostream& output,
             const std::vector<schema::tx_record_t>& records) const;
};

}  // namespace ypbank::codec
