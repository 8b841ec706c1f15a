#include "byte_sink.hpp"
#include <utility>

std::error_code StringSink::write(std::string_view bytes) {
  if (writes_until_failure_ == 0) {
    writes_until_failure_ = -1;
    return write_error_;
  }
  if (writes_until_failure_ > 0) writes_until_failure_--;
  buffer_.append(bytes.data(), bytes.size());
  flushed_ = false;
  write_count_++;
  return {};
}

std::error_code StringSink::flush() {
  if (flush_error_) return flush_error_;
  flushed_ = true;
  flush_count_++;
  return {};
}

void StringSink::fail_write_after(int n, std::error_code ec) {
  writes_until_failure_ = n;
  write_error_ = ec;
}

FdSink::FdSink(int fd, size_t capacity) : fd_(fd), capacity_(capacity) {
  buf_.reserve(capacity_);
}

FdSink::FdSink(UniqueFd fd, size_t capacity)
  : owned_(std::move(fd)), fd_(owned_.get()), capacity_(capacity) {
  buf_.reserve(capacity_);
}

std::error_code FdSink::drain() {
  size_t done = 0;
  while (done < buf_.size()) {
    ssize_t w = ::write(fd_, buf_.data() + done, buf_.size() - done);
    if (w < 0) {
      if (errno == EINTR) continue;
      std::error_code ec(errno, std::system_category());
      buf_.erase(0, done); // keep what never reached the fd
      return ec;
    }
    done += static_cast<size_t>(w);
  }
  buf_.clear();
  return {};
}

std::error_code FdSink::write(std::string_view bytes) {
  if (buf_.size() + bytes.size() > capacity_) {
    if (auto ec = drain()) return ec;
    if (bytes.size() >= capacity_) return write_all(fd_, bytes.data(), bytes.size());
  }
  buf_.append(bytes.data(), bytes.size());
  return {};
}

std::error_code FdSink::flush() {
  return drain();
}

std::error_code OstreamSink::write(std::string_view bytes) {
  os_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!os_) return std::make_error_code(std::errc::io_error);
  return {};
}

std::error_code OstreamSink::flush() {
  os_.flush();
  if (!os_) return std::make_error_code(std::errc::io_error);
  return {};
}
