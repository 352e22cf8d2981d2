#include <ypbank/codec/error.hpp>
#include <ypbank/codec/io.hpp>

#include <algorithm>
#include <string>

namespace ypbank::codec::io {

std::size_t read_some(std::istream& input,
                      uint8_t* data,
                      const std::size_t size) {
  input.read(reinterpret_cast<char*>(data),
             static_cast<std::streamsize>(size));
  if (input.bad()) {
    throw app_error::read_failure("input stream failed");
  }
  return static_cast<std::size_t>(input.gcount());
}

namespace {

app_error short_read(const std::size_t expected, const std::size_t read) {
  return app_error::read_failure("failed to fill whole buffer, expected " +
                                 std::to_string(expected) + " bytes, got " +
                                 std::to_string(read));
}

}  // namespace

void read_exact(std::istream& input, uint8_t* data, const std::size_t size) {
  auto read = read_some(input, data, size);
  if (read != size) {
    throw short_read(size, read);
  }
}

schema::bytes_t read_exact(std::istream& input, const std::size_t size) {
  auto buffer = schema::bytes_t{};
  buffer.reserve(std::min(size, kReadChunkSize));
  while (buffer.size() < size) {
    auto offset = buffer.size();
    auto chunk = std::min(size - offset, kReadChunkSize);
    buffer.resize(offset + chunk);
    auto read = read_some(input, buffer.data() + offset, chunk);
    if (read != chunk) {
      throw short_read(size, offset + read);
    }
  }
  return buffer;
}

bool read_line(std::istream& input, std::string& line) {
  if (!std::getline(input, line)) {
    if (input.bad()) {
      throw app_error::read_failure("input stream failed");
    }
    return false;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  if (!schema::is_valid_utf8(std::string_view{line})) {
    throw app_error::read_failure("stream did not contain valid UTF-8");
  }
  return true;
}

void write_all(std::ostream& output, const schema::bytes_view_t& bytes) {
  output.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
  if (!output) {
    throw app_error::write_failure("output stream failed");
  }
}

void write_all(std::ostream& output, const std::string_view text) {
  write_all(output, schema::make_bytes_view(text));
}

void write_line(std::ostream& output, const std::string_view text) {
  write_all(output, text);
  write_all(output, std::string_view{"\n"});
}

}  // namespace ypbank::codec::io
