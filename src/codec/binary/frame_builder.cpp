#include <boost/endian/conversion.hpp>
#include <algorithm>
#include <iterator>
#include <ypbank/codec/binary/frame_builder.hpp>

using namespace ypbank::codec::binary;

frame_builder& frame_builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

frame_builder& frame_builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

frame_builder& frame_builder::write(const uint8_t value) {
  data.push_back(value);
  return *this;
}

frame_builder& frame_builder::write(const uint32_t value) {
  auto offset = data.size();
  data.resize(offset + sizeof(value));
  boost::endian::store_big_u32(data.data() + offset, value);
  return *this;
}

frame_builder& frame_builder::write(const uint64_t value) {
  auto offset = data.size();
  data.resize(offset + sizeof(value));
  boost::endian::store_big_u64(data.data() + offset, value);
  return *this;
}

frame_builder& frame_builder::write(const int64_t value) {
  auto offset = data.size();
  data.resize(offset + sizeof(value));
  boost::endian::store_big_s64(data.data() + offset, value);
  return *this;
}
