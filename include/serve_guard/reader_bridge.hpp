#pragma once
#include "serve_guard/byte_helpers.hpp"
#include "serve_guard/byte_source.hpp"
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>

namespace sg {

enum class StreamState { Idle, Pulling, Closed, Errored };

const char* to_string(StreamState s) noexcept;

// Consumer side of a bridged stream.
class StreamSink {
public:
  virtual ~StreamSink() = default;
  virtual void enqueue(ByteBuffer chunk) = 0;
  virtual void close() = 0;                      // end of stream
  virtual void error(std::exception_ptr err) = 0; // original source failure
};

// Adapts a ByteSource into a demand-driven stream of byte chunks.
//
// Each pull() is one demand signal: allocate `chunk_size` bytes, read once,
// then enqueue the filled prefix, or signal end/error to the sink. A stream
// ends with exactly one of close() or error(). The source is owned by the
// bridge and closed by it at most once.
class ReaderBridge {
public:
  static constexpr std::size_t kDefaultChunkSize = 16640; // ~16 KiB

  struct Config {
    bool        auto_close = true;                // close on end, error, cancel
    std::size_t chunk_size = kDefaultChunkSize;   // 0 -> default
    std::optional<std::size_t> high_water_mark;   // passed through to the consumer queue
  };

  explicit ReaderBridge(std::unique_ptr<ByteSource> source);
  ReaderBridge(std::unique_ptr<ByteSource> source, Config cfg);
  ~ReaderBridge();

  ReaderBridge(const ReaderBridge&) = delete;
  ReaderBridge& operator=(const ReaderBridge&) = delete;

  // One read into `sink`. Returns true while more data may follow; false once
  // the stream is closed, errored or cancelled, and for a pull issued while
  // another one is still in flight.
  bool pull(StreamSink& sink);

  // Cooperative cancellation. A read already in flight is allowed to settle
  // before the source is closed; its result is discarded.
  void cancel();

  StreamState state() const noexcept;
  bool cancel_requested() const noexcept;
  std::optional<std::size_t> high_water_mark() const noexcept;
  std::size_t chunk_size() const noexcept;
  std::uint64_t bytes_read() const noexcept;

  // Message of the last close failure swallowed during cleanup; empty if none.
  std::string close_error() const;

private:
  struct Impl; Impl* p_;
};

}
