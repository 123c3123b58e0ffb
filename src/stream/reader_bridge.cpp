#include "serve_guard/reader_bridge.hpp"
#include <mutex>
#include <stdexcept>
#include <utility>

namespace sg {

const char* to_string(StreamState s) noexcept {
  switch (s) {
    case StreamState::Idle:    return "idle";
    case StreamState::Pulling: return "pulling";
    case StreamState::Closed:  return "closed";
    case StreamState::Errored: return "errored";
  }
  return "unknown";
}

static std::string describe(const std::exception_ptr& e) {
  try {
    std::rethrow_exception(e);
  } catch (const std::exception& ex) {
    return ex.what();
  } catch (...) {
    return "non-standard exception";
  }
}

struct ReaderBridge::Impl {
  std::unique_ptr<ByteSource> src;
  Config cfg;

  mutable std::mutex mu;
  StreamState state{StreamState::Idle};
  bool cancel_requested{false};
  std::string close_err;

  // Only touched by the party that moved the state machine out of Idle.
  bool source_closed{false};
  std::uint64_t bytes{0};

  Impl(std::unique_ptr<ByteSource> s, Config c) : src(std::move(s)), cfg(std::move(c)) {
    if (cfg.chunk_size == 0) cfg.chunk_size = kDefaultChunkSize;
  }

  void set_state(StreamState s) {
    std::lock_guard<std::mutex> lk(mu);
    state = s;
  }

  // Close the source at most once; sources without the capability are left alone.
  std::exception_ptr close_source() {
    if (source_closed) return nullptr;
    Closer* c = as_closer(*src);
    if (!c) return nullptr;
    source_closed = true;
    try {
      c->close();
    } catch (...) {
      return std::current_exception();
    }
    return nullptr;
  }

  // Cleanup path: a close failure must not shadow what the consumer already saw.
  void close_quietly() {
    if (auto err = close_source()) {
      std::lock_guard<std::mutex> lk(mu);
      close_err = describe(err);
    }
  }
};

ReaderBridge::ReaderBridge(std::unique_ptr<ByteSource> source)
  : ReaderBridge(std::move(source), Config{}) {}

ReaderBridge::ReaderBridge(std::unique_ptr<ByteSource> source, Config cfg)
  : p_(nullptr) {
  if (!source) throw std::invalid_argument("ReaderBridge: null source");
  p_ = new Impl(std::move(source), std::move(cfg));
}

ReaderBridge::~ReaderBridge() { delete p_; }

bool ReaderBridge::pull(StreamSink& sink) {
  {
    std::lock_guard<std::mutex> lk(p_->mu);
    if (p_->state != StreamState::Idle) return false;
    p_->state = StreamState::Pulling;
  }

  ByteBuffer chunk(p_->cfg.chunk_size);
  std::optional<std::size_t> got;
  std::exception_ptr failure;
  try {
    got = p_->src->read(chunk.data(), chunk.size());
    if (got && *got > chunk.size())
      throw std::length_error("source reported more bytes than the buffer holds");
  } catch (...) {
    failure = std::current_exception();
  }

  bool cancelled = false;
  {
    std::lock_guard<std::mutex> lk(p_->mu);
    if (p_->cancel_requested) {
      cancelled = true;
      p_->state = StreamState::Closed;
    } else if (failure) {
      p_->state = StreamState::Errored;
    } else if (got) {
      p_->state = StreamState::Idle;
    }
    // end of data stays Pulling until the source is closed
  }

  if (cancelled) {
    // cancel arrived mid-read; the settled result is dropped
    if (failure || p_->cfg.auto_close) p_->close_quietly();
    return false;
  }

  if (failure) {
    // a failed read always closes, even if the consumer throws from error()
    try {
      sink.error(failure);
    } catch (...) {
      p_->close_quietly();
      throw;
    }
    p_->close_quietly();
    return false;
  }

  if (!got) {
    if (p_->cfg.auto_close) {
      if (auto err = p_->close_source()) {
        p_->set_state(StreamState::Errored);
        sink.error(err);
        return false;
      }
    }
    p_->set_state(StreamState::Closed);
    sink.close();
    return false;
  }

  chunk.resize(*got);
  p_->bytes += *got;
  sink.enqueue(std::move(chunk));
  return state() == StreamState::Idle;
}

void ReaderBridge::cancel() {
  {
    std::lock_guard<std::mutex> lk(p_->mu);
    if (p_->state == StreamState::Closed || p_->state == StreamState::Errored) return;
    if (p_->cancel_requested) return;
    p_->cancel_requested = true;
    if (p_->state == StreamState::Pulling) return; // pull() finishes the cleanup
    p_->state = StreamState::Closed;
  }
  if (p_->cfg.auto_close) p_->close_quietly();
}

StreamState ReaderBridge::state() const noexcept {
  std::lock_guard<std::mutex> lk(p_->mu);
  return p_->state;
}

bool ReaderBridge::cancel_requested() const noexcept {
  std::lock_guard<std::mutex> lk(p_->mu);
  return p_->cancel_requested;
}

std::optional<std::size_t> ReaderBridge::high_water_mark() const noexcept {
  return p_->cfg.high_water_mark;
}

std::size_t ReaderBridge::chunk_size() const noexcept { return p_->cfg.chunk_size; }

std::uint64_t ReaderBridge::bytes_read() const noexcept { return p_->bytes; }

std::string ReaderBridge::close_error() const {
  std::lock_guard<std::mutex> lk(p_->mu);
  return p_->close_err;
}

}
