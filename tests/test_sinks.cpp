#include "byte_sink.hpp"
#include "dispatch.hpp"
#include <cassert>
#include <cerrno>
#include <sstream>
#include <string>
#include <fcntl.h>
#include <unistd.h>

static std::string read_available(int fd) {
  std::string out;
  char buf[256];
  for (;;) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n <= 0) break;
    out.append(buf, static_cast<size_t>(n));
  }
  return out;
}

class Literal : public Command {
public:
  explicit Literal(std::string s) : s_(std::move(s)) {}
  std::string render() const override { return s_; }
  bool supported_on_current_target() const override { return true; }
private:
  std::string s_;
};

static void test_string_sink() {
  StringSink s;
  assert(!s.write("ab"));
  assert(!s.flush());
  assert(s.flushed());
  assert(!s.write("c"));
  assert(!s.flushed()); // a write after flush leaves new bytes pending
  assert(s.contents() == "abc");
  assert(s.write_count() == 2);
  s.fail_write_after(0, std::make_error_code(std::errc::no_space_on_device));
  assert(s.write("d") == std::errc::no_space_on_device);
  assert(s.contents() == "abc");
  assert(!s.write("e")); // one-shot
  s.clear();
  assert(s.contents().empty() && s.flush_count() == 0);
}

static void test_fd_sink_buffers_until_flush() {
  int fds[2];
  assert(::pipe(fds) == 0);
  ::fcntl(fds[0], F_SETFL, O_NONBLOCK);
  UniqueFd reader(fds[0]);
  {
    FdSink sink(UniqueFd(fds[1]), 16);
    assert(!queue(sink, Literal("cmdA"), Literal("cmdB")));
    assert(sink.pending() == 8);
    assert(read_available(reader.get()).empty());
    assert(!sink.flush());
    assert(sink.pending() == 0);
    assert(read_available(reader.get()) == "cmdAcmdB");

    // overflowing the buffer drains it; oversized writes go straight through
    assert(!sink.write("0123456789"));
    assert(!sink.write("abcdefghij"));
    assert(sink.pending() == 10);
    assert(!sink.write(std::string(40, 'x')));
    assert(sink.pending() == 0);
    assert(read_available(reader.get()) == "0123456789abcdefghij" + std::string(40, 'x'));
  }
}

static void test_fd_sink_reports_errors() {
  int fds[2];
  assert(::pipe(fds) == 0);
  ::close(fds[0]);
  ::close(fds[1]);
  FdSink closed(fds[1]);
  assert(!closed.write("x")); // buffered, not yet observed
  CommandError err = execute(closed, Literal("y"));
  assert(err.origin() == CommandError::Origin::Flush);
  assert(err.cause() == std::errc::bad_file_descriptor);
  assert(closed.pending() == 2); // nothing reached the fd, nothing dropped
}

static void test_ostream_sink() {
  std::ostringstream os;
  OstreamSink sink(os);
  assert(!execute(sink, Literal("a"), Literal("b")));
  assert(os.str() == "ab");
  os.setstate(std::ios_base::badbit);
  CommandError err = queue(sink, Literal("c"));
  assert(err.origin() == CommandError::Origin::Write);
  assert(err.cause() == std::errc::io_error);
}

int main() {
  test_string_sink();
  test_fd_sink_buffers_until_flush();
  test_fd_sink_reports_errors();
  test_ostream_sink();
  return 0;
}
