#include "serve_guard/line_reader.hpp"
#include "serve_guard/byte_helpers.hpp"
#include "serve_guard/reader_bridge.hpp"
#include <cerrno>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static std::vector<std::string> lines_of(sg::ByteSource& src, sg::LineReader::Config cfg) {
  std::vector<std::string> out;
  sg::LineReader r(src, cfg);
  bool ok = r.for_each_line([&](std::string_view s) { out.emplace_back(s); });
  expect(ok, "line reader finished: " + r.error());
  return out;
}

int main() {
  const fs::path f = "tests/data/request_crlf.txt";
  if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; return 2; }

  // request head from a file, tiny chunks so lines straddle reads
  {
    int err = 0;
    auto src = sg::FileSource::open(f.string(), &err);
    if (!src) { std::cerr << "[ERR] open failed errno=" << err << "\n"; return 2; }
    expect(src->path() == f.string(), "source keeps its path");
    sg::LineReader::Config cfg;
    cfg.chunk_bytes = 5;
    auto lines = lines_of(*src, cfg);
    expect(lines.size() == 5, "five lines, got " + std::to_string(lines.size()));
    if (lines.size() == 5) {
      expect(lines[0] == "GET /index.html HTTP/1.1", "request line");
      expect(lines[1] == "Host: example.test", "host header");
      expect(sg::strip_blanks(lines[2]) == "Accept:text/html", "blanks stripped from header");
      expect(lines[3].empty(), "blank separator line");
      expect(lines[4] == "body line without ending", "unterminated tail emitted");
    }
    expect(src->is_open(), "line reader does not close its source");
    src->close();
    src->close(); // idempotent
    expect(!src->is_open(), "closed");
    bool threw = false;
    std::uint8_t b[4];
    try { (void)src->read(b, sizeof b); } catch (const std::system_error& e) { threw = e.code().value() == EBADF; }
    expect(threw, "read after close throws EBADF");
  }

  // missing file reports errno
  {
    int err = 0;
    auto src = sg::FileSource::open("tests/data/does-not-exist.txt", &err);
    expect(!src && err == ENOENT, "missing file -> ENOENT");
  }

  // strip_cr off keeps the CR
  {
    sg::StringSource src("a\r\nb\n");
    sg::LineReader::Config cfg;
    cfg.strip_cr = false;
    auto lines = lines_of(src, cfg);
    expect(lines.size() == 2 && lines[0] == "a\r" && lines[1] == "b", "CR kept when strip_cr is off");
  }

  // a lone CR at the end of input is a line ending too
  {
    sg::StringSource src("a\r\nlast\r");
    auto lines = lines_of(src, sg::LineReader::Config{});
    expect(lines.size() == 2 && lines[0] == "a" && lines[1] == "last", "trailing CR on final line stripped");

    sg::StringSource src2("x\r\r\n");
    auto inner = lines_of(src2, sg::LineReader::Config{});
    expect(inner.size() == 1 && inner[0] == "x\r", "only the CRLF of a terminated line is stripped");

    sg::StringSource src3("last\r");
    sg::LineReader::Config cfg;
    cfg.strip_cr = false;
    auto kept = lines_of(src3, cfg);
    expect(kept.size() == 1 && kept[0] == "last\r", "trailing CR kept when strip_cr is off");
  }

  // oversize lines: dropped, or truncated
  {
    sg::StringSource src("short\nthis-line-is-too-long\nok\n");
    sg::LineReader::Config cfg;
    cfg.max_record_bytes = 8;
    cfg.chunk_bytes = 4;
    auto dropped = lines_of(src, cfg);
    expect(dropped.size() == 2 && dropped[0] == "short" && dropped[1] == "ok", "oversize line dropped");

    sg::StringSource src2("short\nthis-line-is-too-long\nok\n");
    cfg.drop_oversize = false;
    auto cut = lines_of(src2, cfg);
    expect(cut.size() == 3 && cut[1] == "this-lin" && cut[2] == "ok", "oversize line truncated");
  }

  // file bridged into a stream: bytes match the file
  {
    auto src = sg::FileSource::open(f.string());
    if (!src) { std::cerr << "[ERR] reopen failed\n"; return 2; }
    auto* raw = src.get();
    struct Collect : sg::StreamSink {
      std::string body; bool ended = false, failed = false;
      void enqueue(sg::ByteBuffer c) override { body.append(c.begin(), c.end()); }
      void close() override { ended = true; }
      void error(std::exception_ptr) override { failed = true; }
    } sink;
    sg::ReaderBridge::Config cfg;
    cfg.chunk_size = 7;
    sg::ReaderBridge bridge(std::move(src), cfg);
    while (bridge.pull(sink)) {}
    expect(sink.ended && !sink.failed, "file stream ended");
    expect(sink.body.size() == fs::file_size(f), "all file bytes streamed");
    expect(!raw->is_open(), "file closed by auto_close");
  }

  if (failures) { std::cerr << "[FAIL] " << failures << " line reader checks failed\n"; return 1; }
  std::cout << "[PASS] line reader\n";
  return 0;
}
