#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace sg {

// Pull-based byte producer.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Fill up to `len` bytes of `buf`. std::nullopt signals end of data; a
  // returned 0 is an ordinary empty read. Throws on I/O failure.
  virtual std::optional<std::size_t> read(std::uint8_t* buf, std::size_t len) = 0;
};

// Optional capability of a ByteSource: releases the underlying handle.
class Closer {
public:
  virtual ~Closer() = default;
  virtual void close() = 0;
};

// nullptr when `src` cannot be closed.
Closer* as_closer(ByteSource& src) noexcept;

// In-memory body. Readable only.
class StringSource : public ByteSource {
public:
  explicit StringSource(std::string data, std::size_t max_read = 0);

  std::optional<std::size_t> read(std::uint8_t* buf, std::size_t len) override;

private:
  std::string data_;
  std::size_t pos_{0};
  std::size_t max_read_{0}; // 0 = no cap per read
};

// File handle opened for binary reading. Readable and closable.
class FileSource : public ByteSource, public Closer {
public:
  // nullptr on failure; errno is stored in *err_out when given.
  static std::unique_ptr<FileSource> open(const std::string& path,
                                          int* err_out = nullptr);
  ~FileSource() override;

  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  std::optional<std::size_t> read(std::uint8_t* buf, std::size_t len) override;
  void close() override;

  bool is_open() const noexcept;
  const std::string& path() const noexcept;

private:
  struct Impl; Impl* p_;
  explicit FileSource(Impl* impl);
};

}
