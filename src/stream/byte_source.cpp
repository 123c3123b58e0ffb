#include "serve_guard/byte_source.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>

namespace sg {

Closer* as_closer(ByteSource& src) noexcept { return dynamic_cast<Closer*>(&src); }

StringSource::StringSource(std::string data, std::size_t max_read)
  : data_(std::move(data)), max_read_(max_read) {}

std::optional<std::size_t> StringSource::read(std::uint8_t* buf, std::size_t len) {
  if (pos_ >= data_.size()) return std::nullopt;
  std::size_t n = std::min(len, data_.size() - pos_);
  if (max_read_ > 0) n = std::min(n, max_read_);
  std::memcpy(buf, data_.data() + pos_, n);
  pos_ += n;
  return n;
}

struct FileSource::Impl {
  std::string path;
  FILE* f = nullptr;
};

FileSource::FileSource(Impl* impl) : p_(impl) {}

std::unique_ptr<FileSource> FileSource::open(const std::string& path, int* err_out) {
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) {
    if (err_out) *err_out = errno;
    return nullptr;
  }
  if (err_out) *err_out = 0;
  Impl* impl = nullptr;
  try {
    impl = new Impl{path, f};
    return std::unique_ptr<FileSource>(new FileSource(impl));
  } catch (...) {
    delete impl;
    std::fclose(f);
    throw;
  }
}

FileSource::~FileSource() {
  if (p_->f) std::fclose(p_->f);
  delete p_;
}

std::optional<std::size_t> FileSource::read(std::uint8_t* buf, std::size_t len) {
  if (!p_->f) throw std::system_error(EBADF, std::generic_category(), "read " + p_->path);
  if (len == 0) return std::size_t{0};
  std::size_t n = std::fread(buf, 1, len, p_->f);
  if (n == 0 && std::ferror(p_->f)) {
    const int err = errno;
    throw std::system_error(err, std::generic_category(), "read " + p_->path);
  }
  if (n == 0 && std::feof(p_->f)) return std::nullopt;
  return n;
}

void FileSource::close() {
  if (!p_->f) return;
  FILE* f = p_->f;
  p_->f = nullptr;
  if (std::fclose(f) != 0) {
    const int err = errno;
    throw std::system_error(err, std::generic_category(), "close " + p_->path);
  }
}

bool FileSource::is_open() const noexcept { return p_->f != nullptr; }
const std::string& FileSource::path() const noexcept { return p_->path; }

}
