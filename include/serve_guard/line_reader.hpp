#pragma once
#include "serve_guard/byte_source.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace sg {

// Splits a ByteSource into LF-terminated lines.
class LineReader {
public:
  struct Config {
    std::size_t chunk_bytes      = 16640;           // read size
    std::size_t max_record_bytes = 8 * 1024 * 1024; // 8 MiB guard per line
    bool        strip_cr         = true;            // CRLF -> line
    bool        drop_oversize    = true;            // else truncate to guard
  };

  using LineCallback = std::function<void(std::string_view)>;

  explicit LineReader(ByteSource& src);
  LineReader(ByteSource& src, Config cfg);

  // Returns false if the source failed; see error().
  bool for_each_line(const LineCallback& cb);

  const std::string& error() const noexcept { return err_; }
  std::uint64_t bytes_read() const noexcept { return bytes_; }

private:
  ByteSource& src_;
  Config cfg_;
  std::string err_;
  std::uint64_t bytes_{0};
};

}
