#include <ypbank/schema/primitives.hpp>

#include <cctype>
#include <string_view>

namespace ypbank::schema {

namespace {

bool is_continuation(const uint8_t byte) {
  return (byte & 0xC0u) == 0x80u;
}

// Length of the well-formed sequence starting at `index`, or 0 when it is
// malformed. Ranges follow Unicode table 3-7.
std::size_t utf8_sequence_length(const bytes_view_t& bytes,
                                 const std::size_t index) {
  auto lead = bytes[index];
  auto remaining = bytes.size() - index;
  if (lead < 0x80u) {
    return 1;
  }
  if (lead >= 0xC2u && lead <= 0xDFu) {
    if (remaining < 2 || !is_continuation(bytes[index + 1])) {
      return 0;
    }
    return 2;
  }
  if (lead >= 0xE0u && lead <= 0xEFu) {
    if (remaining < 3) {
      return 0;
    }
    auto second = bytes[index + 1];
    auto lower = uint8_t{0x80};
    auto upper = uint8_t{0xBF};
    if (lead == 0xE0u) {
      lower = 0xA0;
    } else if (lead == 0xEDu) {
      upper = 0x9F;
    }
    if (second < lower || second > upper ||
        !is_continuation(bytes[index + 2])) {
      return 0;
    }
    return 3;
  }
  if (lead >= 0xF0u && lead <= 0xF4u) {
    if (remaining < 4) {
      return 0;
    }
    auto second = bytes[index + 1];
    auto lower = uint8_t{0x80};
    auto upper = uint8_t{0xBF};
    if (lead == 0xF0u) {
      lower = 0x90;
    } else if (lead == 0xF4u) {
      upper = 0x8F;
    }
    if (second < lower || second > upper ||
        !is_continuation(bytes[index + 2]) ||
        !is_continuation(bytes[index + 3])) {
      return 0;
    }
    return 4;
  }
  return 0;
}

}  // namespace

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = "0123456789ABCDEF";
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto value : bytes) {
    out.push_back(kHex[(value >> 4u) & 0x0Fu]);
    out.push_back(kHex[value & 0x0Fu]);
  }
  return out;
}

bool is_valid_utf8(const bytes_view_t& bytes) {
  auto index = std::size_t{0};
  while (index < bytes.size()) {
    auto length = utf8_sequence_length(bytes, index);
    if (length == 0) {
      return false;
    }
    index += length;
  }
  return true;
}

bool is_valid_utf8(const std::string_view& text) {
  return is_valid_utf8(make_bytes_view(text));
}

std::string_view trim(std::string_view text) {
  while (!text.empty() &&
         std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() &&
         std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

}  // namespace ypbank::schema
