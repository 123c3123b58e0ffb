#include "serve_guard/byte_helpers.hpp"
#include <cstddef>

namespace sg {

static constexpr std::uint8_t kSpace = 0x20;
static constexpr std::uint8_t kHtab  = 0x09;
static constexpr std::uint8_t kCr    = 0x0D;
static constexpr std::uint8_t kLf    = 0x0A;

static inline bool is_blank(std::uint8_t c) { return c == kSpace || c == kHtab; }

ByteBuffer strip_blanks(const ByteBuffer& in) {
  ByteBuffer out;
  out.reserve(in.size());
  for (auto c : in) if (!is_blank(c)) out.push_back(c);
  return out;
}

std::string strip_blanks(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  for (char c : in) if (!is_blank(static_cast<std::uint8_t>(c))) out.push_back(c);
  return out;
}

// Number of trailing bytes that form the line ending (0, 1 or 2).
template <class Bytes>
static std::size_t eol_width(const Bytes& b) {
  const std::size_t n = b.size();
  if (n == 0 || static_cast<std::uint8_t>(b[n - 1]) != kLf) return 0;
  if (n > 1 && static_cast<std::uint8_t>(b[n - 2]) == kCr) return 2;
  return 1;
}

ByteBuffer strip_line_ending(const ByteBuffer& in) {
  return ByteBuffer(in.begin(), in.end() - static_cast<std::ptrdiff_t>(eol_width(in)));
}

std::string_view strip_line_ending(std::string_view in) {
  in.remove_suffix(eol_width(in));
  return in;
}

}
