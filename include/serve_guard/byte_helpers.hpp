#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sg {

using ByteBuffer = std::vector<std::uint8_t>;

// Drop every SP (0x20) and HTAB (0x09) byte, keeping the order of the rest.
ByteBuffer  strip_blanks(const ByteBuffer& in);
std::string strip_blanks(std::string_view in);

// Drop a trailing LF, or CRLF. Interior bytes are never touched.
// The string_view overload returns a view into `in`; it is only valid while
// the caller's bytes are.
ByteBuffer       strip_line_ending(const ByteBuffer& in);
std::string_view strip_line_ending(std::string_view in);

}
