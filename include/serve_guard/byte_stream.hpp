#pragma once
#include "serve_guard/reader_bridge.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace sg {

// Queue-backed reader over a ReaderBridge. The queue is topped up while the
// bytes it holds stay below the bridge's high-water mark (default 0: pull
// only when next() finds it empty).
class ByteStream {
public:
  explicit ByteStream(std::unique_ptr<ByteSource> source);
  ByteStream(std::unique_ptr<ByteSource> source, ReaderBridge::Config cfg);
  ~ByteStream();

  ByteStream(const ByteStream&) = delete;
  ByteStream& operator=(const ByteStream&) = delete;

  // Next chunk in source order, std::nullopt at end of stream. Rethrows the
  // source's exception once the stream has errored.
  std::optional<ByteBuffer> next();

  // Drain everything into one string.
  std::string read_all();

  void cancel();

  bool done() const noexcept;
  std::size_t queued_bytes() const noexcept;
  const ReaderBridge& bridge() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
