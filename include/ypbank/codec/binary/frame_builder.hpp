#pragma once
#include <ypbank/schema/primitives.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace ypbank::codec::binary {

// Appends big-endian fields to an in-memory frame.
struct frame_builder final {
  schema::bytes_t data;

  frame_builder& write(const std::string_view& str);
  frame_builder& write(const std::span<const uint8_t>& bytes);
  frame_builder& write(uint8_t value);
  frame_builder& write(uint32_t value);
  frame_builder& write(uint64_t value);
  frame_builder& write(int64_t value);
};

}  // namespace ypbank::codec::binary
