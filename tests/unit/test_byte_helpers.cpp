#include "serve_guard/byte_helpers.hpp"
#include <iostream>
#include <string>
#include <string_view>

static int failures = 0;

static void expect(bool ok, const char* what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static sg::ByteBuffer bytes(std::string_view s) { return sg::ByteBuffer(s.begin(), s.end()); }

int main() {
  // strip_line_ending: CRLF once, then a no-op
  {
    auto once = sg::strip_line_ending(bytes("Host: a\r\n"));
    expect(once == bytes("Host: a"), "CRLF dropped");
    expect(sg::strip_line_ending(once) == once, "second strip is a no-op");
  }
  expect(sg::strip_line_ending(bytes("line\n")) == bytes("line"), "bare LF dropped");
  expect(sg::strip_line_ending(bytes("line\r")) == bytes("line\r"), "lone CR kept");
  expect(sg::strip_line_ending(bytes("a\r\nb")) == bytes("a\r\nb"), "interior CRLF kept");
  expect(sg::strip_line_ending(bytes("\n")).empty(), "just LF");
  expect(sg::strip_line_ending(bytes("\r\n")).empty(), "just CRLF");
  expect(sg::strip_line_ending(bytes("")).empty(), "empty buffer");
  expect(sg::strip_line_ending(bytes("x\n\n")) == bytes("x\n"), "only one LF per call");
  expect(sg::strip_line_ending(std::string_view("GET / HTTP/1.1\r\n")) == "GET / HTTP/1.1",
         "string_view overload");

  // strip_blanks filters the whole buffer, not just a leading run
  expect(sg::strip_blanks(bytes("no-blanks")) == bytes("no-blanks"), "no blanks -> equal");
  expect(sg::strip_blanks(bytes(" \t \t  ")).empty(), "all blanks -> empty");
  expect(sg::strip_blanks(bytes("  a b\tc ")) == bytes("abc"), "blanks removed everywhere");
  expect(sg::strip_blanks(bytes("a\r\nb")) == bytes("a\r\nb"), "CR/LF are not blanks");
  expect(sg::strip_blanks(std::string_view("\tmultipart/form-data; boundary=x")) ==
             "multipart/form-data;boundary=x",
         "string_view overload");

  if (failures) return 1;
  std::cout << "[PASS] byte helpers\n";
  return 0;
}
