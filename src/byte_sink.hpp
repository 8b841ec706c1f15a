#pragma once
/*
 * IByteSink
 *
 * Purpose: byte destination for rendered commands: sequential writes + explicit flush.
 * Contract: failures come back as error_code, never as silent truncation.
 * Impls: StringSink (memory, tests), FdSink (buffered POSIX fd), OstreamSink (std::ostream).
 * Note: FdSink does not flush on destruction; unflushed bytes are dropped.
 */
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include "config.hpp"
#include "posix_fd.hpp"

class IByteSink {
public:
  virtual ~IByteSink() = default;
  virtual std::error_code write(std::string_view bytes) = 0;
  virtual std::error_code flush() = 0;
};

class StringSink : public IByteSink {
public:
  std::error_code write(std::string_view bytes) override;
  std::error_code flush() override;

  const std::string& contents() const { return buffer_; }
  bool flushed() const { return flushed_; }
  int flush_count() const { return flush_count_; }
  int write_count() const { return write_count_; }
  void clear() { buffer_.clear(); flushed_ = false; flush_count_ = 0; write_count_ = 0; }

  // Fail the n-th write from now (0 = next one); -1 disables.
  void fail_write_after(int n, std::error_code ec = std::make_error_code(std::errc::io_error));
  void fail_flush(std::error_code ec = std::make_error_code(std::errc::io_error)) { flush_error_ = ec; }

private:
  std::string buffer_;
  bool flushed_ = false;
  int flush_count_ = 0;
  int write_count_ = 0;
  int writes_until_failure_ = -1;
  std::error_code write_error_;
  std::error_code flush_error_;
};

class FdSink : public IByteSink {
public:
  // Borrows `fd`; the caller keeps ownership.
  explicit FdSink(int fd, size_t capacity = TERMCMD_FD_SINK_CAPACITY);
  // Takes ownership and closes on destruction.
  explicit FdSink(UniqueFd fd, size_t capacity = TERMCMD_FD_SINK_CAPACITY);
  FdSink(const FdSink&) = delete;
  FdSink& operator=(const FdSink&) = delete;

  std::error_code write(std::string_view bytes) override;
  std::error_code flush() override;

  int fd() const { return fd_; }
  size_t pending() const { return buf_.size(); }

private:
  std::error_code drain();

  UniqueFd owned_;
  int fd_;
  size_t capacity_;
  std::string buf_;
};

class OstreamSink : public IByteSink {
public:
  explicit OstreamSink(std::ostream& os) : os_(os) {}
  std::error_code write(std::string_view bytes) override;
  std::error_code flush() override;
private:
  std::ostream& os_;
};
