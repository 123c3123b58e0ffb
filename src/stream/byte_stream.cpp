#include "serve_guard/byte_stream.hpp"
#include <deque>
#include <utility>

namespace sg {

struct ByteStream::Impl : StreamSink {
  ReaderBridge bridge;
  std::deque<ByteBuffer> queue;
  std::size_t queued{0};
  bool ended{false};
  std::exception_ptr err;

  Impl(std::unique_ptr<ByteSource> src, ReaderBridge::Config cfg)
    : bridge(std::move(src), std::move(cfg)) {}

  void enqueue(ByteBuffer chunk) override {
    queued += chunk.size();
    queue.push_back(std::move(chunk));
  }
  void close() override { ended = true; }
  void error(std::exception_ptr e) override {
    err = std::move(e);
    queue.clear();
    queued = 0;
  }

  bool active() const { return !ended && !err && bridge.state() == StreamState::Idle; }

  // Pull for a waiting reader, then while the queue is below the watermark.
  // An empty read is handed out as-is rather than pulled past.
  void fill(bool waiting) {
    const std::size_t hwm = bridge.high_water_mark().value_or(0);
    while (active()) {
      const bool want = (waiting && queue.empty()) || queued < hwm;
      if (!want) break;
      const std::size_t before = queued;
      if (!bridge.pull(*this)) break;
      if (queued == before && !queue.empty()) break;
    }
  }
};

ByteStream::ByteStream(std::unique_ptr<ByteSource> source)
  : ByteStream(std::move(source), ReaderBridge::Config{}) {}

ByteStream::ByteStream(std::unique_ptr<ByteSource> source, ReaderBridge::Config cfg)
  : p_(new Impl(std::move(source), std::move(cfg))) {}

ByteStream::~ByteStream() { delete p_; }

std::optional<ByteBuffer> ByteStream::next() {
  if (p_->queue.empty()) p_->fill(true);
  if (p_->err) std::rethrow_exception(p_->err);
  if (p_->queue.empty()) return std::nullopt;

  ByteBuffer out = std::move(p_->queue.front());
  p_->queue.pop_front();
  p_->queued -= out.size();
  p_->fill(false);
  return out;
}

std::string ByteStream::read_all() {
  std::string out;
  while (auto chunk = next()) out.append(chunk->begin(), chunk->end());
  return out;
}

void ByteStream::cancel() {
  p_->bridge.cancel();
  p_->queue.clear();
  p_->queued = 0;
}

bool ByteStream::done() const noexcept {
  return p_->queue.empty() && !p_->active();
}

std::size_t ByteStream::queued_bytes() const noexcept { return p_->queued; }

const ReaderBridge& ByteStream::bridge() const noexcept { return p_->bridge; }

}
