#include "serve_guard/url_codec.hpp"
#include <cstdint>

namespace sg {

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

static bool is_escape_at(std::string_view s, std::size_t i) {
  return i + 2 < s.size() && s[i] == '%' && hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0;
}

// Strict UTF-8 check: no overlongs, no surrogates, max U+10FFFF.
static bool valid_utf8(std::string_view s) {
  std::size_t i = 0;
  while (i < s.size()) {
    const auto c = static_cast<std::uint8_t>(s[i]);
    std::size_t extra;
    std::uint32_t cp;
    if (c < 0x80) { ++i; continue; }
    if ((c & 0xE0) == 0xC0)      { extra = 1; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
    else return false;
    if (i + extra >= s.size()) return false;
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto cc = static_cast<std::uint8_t>(s[i + k]);
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
        (extra == 3 && cp < 0x10000)) return false;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    i += extra + 1;
  }
  return true;
}

std::string decode_component(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '%') { out.push_back(text[i]); continue; }
    if (!is_escape_at(text, i)) return std::string(text);
    out.push_back(static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2])));
    i += 2;
  }
  if (!valid_utf8(out)) return std::string(text);
  return out;
}

// Bytes left as-is by encode_url: RFC 3986 unreserved + reserved, minus '%'
// which is handled separately.
static bool url_safe(unsigned char c) {
  if (c >= 'a' && c <= 'z') return true;
  if (c >= '?' && c <= '[') return true;   // ? @ A-Z [
  if (c >= '&' && c <= ';') return true;   // & ' ( ) * + , - . / 0-9 : ;
  switch (c) {
    case '!': case '#': case '$': case '=': case ']': case '_': case '~':
      return true;
    default:
      return false;
  }
}

static void put_escape(std::string& out, unsigned char c) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  out.push_back('%');
  out.push_back(kHex[c >> 4]);
  out.push_back(kHex[c & 0x0F]);
}

std::string encode_url(std::string_view url) {
  std::string out;
  out.reserve(url.size());
  for (std::size_t i = 0; i < url.size(); ++i) {
    const auto c = static_cast<unsigned char>(url[i]);
    if (c == '%') {
      // valid escape, or "%X" cut off by the end of input: left as-is
      if (is_escape_at(url, i) || (i + 2 == url.size() && hex_value(url[i + 1]) >= 0)) {
        out.push_back('%');
        continue;
      }
      // a broken escape also takes the byte(s) it would have covered
      out += "%25";
      std::size_t take = 0;
      if (i + 1 < url.size()) take = hex_value(url[i + 1]) >= 0 ? 2 : 1;
      for (std::size_t k = 1; k <= take; ++k) {
        const auto b = static_cast<unsigned char>(url[i + k]);
        if (b != '%' && b != '[' && b != ']' && url_safe(b)) out.push_back(static_cast<char>(b));
        else put_escape(out, b);
      }
      i += take;
      continue;
    }
    if (url_safe(c)) out.push_back(static_cast<char>(c));
    else put_escape(out, c);
  }
  return out;
}

}
