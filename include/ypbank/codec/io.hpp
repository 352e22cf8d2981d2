#pragma once
#include <ypbank/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

// Stream plumbing shared by the codecs. Failures of the underlying stream
// are raised as app_error read/write failures without a location.
namespace ypbank::codec::io {

/// Read up to `size` bytes; returns how many were read before end of stream.
std::size_t read_some(std::istream& input, uint8_t* data, std::size_t size);

/// Read exactly `size` bytes or raise a read failure.
void read_exact(std::istream& input, uint8_t* data, std::size_t size);

/// Read exactly `size` bytes into a new buffer or raise a read failure.
///
/// The buffer grows by at most kReadChunkSize per read, so a length taken
/// from untrusted input is never allocated up front.
schema::bytes_t read_exact(std::istream& input, std::size_t size);

inline constexpr auto kReadChunkSize = std::size_t{64 * 1024};

/// Read one line without its LF or CRLF terminator.
///
/// Returns false at end of stream. Lines that are not valid UTF-8 are a read
/// failure.
bool read_line(std::istream& input, std::string& line);

void write_all(std::ostream& output, const schema::bytes_view_t& bytes);
void write_all(std::ostream& output, std::string_view text);
void write_line(std::ostream& output, std::string_view text);

}  // namespace ypbank::codec::io
