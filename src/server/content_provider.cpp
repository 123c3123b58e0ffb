#include "serve_guard/content_provider.hpp"
#include <httplib.h>
#include <utility>

namespace sg {

DataSinkAdapter::DataSinkAdapter(httplib::DataSink& sink) : sink_(sink) {}

void DataSinkAdapter::enqueue(ByteBuffer chunk) {
  // A zero-length write would end httplib's chunk loop early.
  if (chunk.empty() || failed_) return;
  if (!sink_.write(reinterpret_cast<const char*>(chunk.data()), chunk.size()))
    failed_ = true;
}

void DataSinkAdapter::close() {
  ended_ = true;
  if (!failed_) sink_.done();
}

void DataSinkAdapter::error(std::exception_ptr /*err*/) {
  // httplib has no error channel for a started body; aborting is the signal
  failed_ = true;
}

void set_stream_content(httplib::Response& res,
                        std::unique_ptr<ByteSource> source,
                        const std::string& content_type,
                        ReaderBridge::Config cfg) {
  auto bridge = std::make_shared<ReaderBridge>(std::move(source), std::move(cfg));
  res.set_chunked_content_provider(
      content_type,
      [bridge](size_t /*offset*/, httplib::DataSink& sink) {
        DataSinkAdapter out(sink);
        const bool more = bridge->pull(out);
        if (out.failed()) {
          // source error or client gone; cancel is a no-op after an error
          bridge->cancel();
          return false;
        }
        // stopped without an end signal (cancelled): abort the response
        return more || out.ended();
      },
      [bridge](bool success) {
        if (!success) bridge->cancel();
      });
}

}
