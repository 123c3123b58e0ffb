#pragma once
#include "serve_guard/byte_source.hpp"
#include "serve_guard/reader_bridge.hpp"
#include <memory>
#include <string>

namespace httplib {
struct Response;
class DataSink;
}

namespace sg {

// StreamSink writing into an httplib chunked response.
class DataSinkAdapter : public StreamSink {
public:
  explicit DataSinkAdapter(httplib::DataSink& sink);

  void enqueue(ByteBuffer chunk) override;
  void close() override;
  void error(std::exception_ptr err) override;

  // True after a failed write or a stream error; the provider must abort.
  bool failed() const noexcept { return failed_; }
  bool ended() const noexcept { return ended_; }

private:
  httplib::DataSink& sink_;
  bool failed_{false};
  bool ended_{false};
};

// Stream `source` as the chunked body of `res`. Every provider call from
// httplib is one pull; a client that goes away cancels the bridge.
void set_stream_content(httplib::Response& res,
                        std::unique_ptr<ByteSource> source,
                        const std::string& content_type,
                        ReaderBridge::Config cfg = {});

}
