#include "serve_guard/line_reader.hpp"
#include "serve_guard/byte_helpers.hpp"
#include <exception>
#include <vector>

namespace sg {

LineReader::LineReader(ByteSource& src) : LineReader(src, Config{}) {}

LineReader::LineReader(ByteSource& src, Config cfg) : src_(src), cfg_(cfg) {
  if (cfg_.chunk_bytes == 0) cfg_.chunk_bytes = Config{}.chunk_bytes;
}

bool LineReader::for_each_line(const LineCallback& cb) {
  std::vector<std::uint8_t> buf(cfg_.chunk_bytes);
  std::string carry;
  carry.reserve(256);
  bool skipping_oversize = false; // drop until next newline

  // `line` includes its '\n' when it had one.
  auto emit = [&](std::string_view line) {
    const bool had_nl = !line.empty() && line.back() == '\n';
    if (cfg_.strip_cr) {
      line = strip_line_ending(line);
      // unterminated or truncated line: a trailing CR is still the ending
      if (!had_nl && !line.empty() && line.back() == '\r') line.remove_suffix(1);
    } else if (had_nl) {
      line.remove_suffix(1);
    }
    cb(line);
  };

  while (true) {
    std::optional<std::size_t> got;
    try {
      got = src_.read(buf.data(), buf.size());
    } catch (const std::exception& e) {
      err_ = e.what();
      return false;
    }
    if (!got) break;
    bytes_ += *got;

    std::string_view block(reinterpret_cast<const char*>(buf.data()), *got);
    std::size_t start = 0;
    while (start < block.size()) {
      const std::size_t pos = block.find('\n', start);
      const bool hit_nl = (pos != std::string_view::npos);
      std::string_view slice = hit_nl ? block.substr(start, pos + 1 - start)
                                      : block.substr(start);
      start = hit_nl ? pos + 1 : block.size();

      if (skipping_oversize) {
        if (hit_nl) skipping_oversize = false;
        continue;
      }

      const std::size_t payload = slice.size() - (hit_nl ? 1 : 0);
      if (carry.size() + payload > cfg_.max_record_bytes) {
        if (!cfg_.drop_oversize) {
          // truncate and emit as best-effort
          carry.append(slice.substr(0, cfg_.max_record_bytes - carry.size()));
          emit(carry);
        }
        carry.clear();
        skipping_oversize = !hit_nl;
        continue;
      }

      if (!hit_nl) { carry.append(slice); continue; }

      if (carry.empty()) {
        emit(slice);
      } else {
        carry.append(slice);
        emit(carry);
        carry.clear();
      }
    }
  }

  if (!carry.empty() && !skipping_oversize) emit(carry);
  return true;
}

}
