#include "commands.hpp"
#include "dispatch.hpp"
#include "headless_terminal.hpp"
#include "ansi_support.hpp"
#include <cassert>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

// With escape sequences disabled every standard command takes the native path:
// the sink stays untouched and queue/execute both apply immediately.

static void test_queue_goes_native() {
  StringSink sink;
  HeadlessTerminal native;
  assert(!queue(sink, native, MoveTo(4, 2), Print("ok"), SetAttribute(Attribute::Underlined)));
  assert(sink.contents().empty());
  assert(sink.write_count() == 0);
  assert((native.calls() == std::vector<std::string>{"move 2,4", "print ok", "attr Underlined"}));
  assert(native.active_attributes() == Attributes(Attribute::Underlined));
}

static void test_execute_still_flushes() {
  StringSink sink;
  HeadlessTerminal native;
  assert(!execute(sink, native, HideCursor(), Clear(ClearType::All)));
  assert(sink.contents().empty());
  assert(sink.flush_count() == 1);
  assert(!native.cursor_visible());
}

static void test_native_failure_stops_batch() {
  StringSink sink;
  HeadlessTerminal native;
  assert(!queue(sink, native, Print("a")));
  native.fail_next();
  CommandError err = execute(sink, native, Print("b"), Print("c"));
  assert(err.origin() == CommandError::Origin::Native);
  assert(native.printed() == "a");
  assert(sink.flush_count() == 0);
}

static void test_sequence_form() {
  StringSink sink;
  HeadlessTerminal native;
  MoveTo move(0, 0);
  SetAttributes attrs(Attributes{Attribute::Bold, Attribute::Hidden});
  std::vector<const Command*> cmds{&move, &attrs};
  assert(!execute_all(sink, native, cmds));
  assert((native.active_attributes() == Attributes{Attribute::Bold, Attribute::Hidden}));
  assert(sink.flush_count() == 1);
}

struct RenderOnly : Command {
  std::string render() const override { return "\x1B[9m"; }
};

static void test_stream_formatting_goes_native() {
  HeadlessTerminal native;
  std::ostringstream os;
  format_command(os, MoveTo(1, 2), native);
  format_command(os, Print("hi"), native);
  assert(os.good());
  assert(os.str().empty());
  assert(native.printed() == "hi");
  assert((native.calls() == std::vector<std::string>{"move 2,1", "print hi"}));

  // no native equivalent: nothing written, failbit set
  std::ostringstream bad;
  format_command(bad, RenderOnly(), native);
  assert(bad.fail());
  assert(bad.str().empty());

  native.fail_next();
  std::ostringstream failed;
  format_command(failed, Print("x"), native);
  assert(failed.fail());
  assert(failed.str().empty());
  assert(native.printed() == "hi");
}

int main() {
  setenv("TERMCMD_ANSI", "never", 1);
  assert(!ansi_supported());
  assert(!Print("x").supported_on_current_target());
  test_queue_goes_native();
  test_execute_still_flushes();
  test_native_failure_stops_batch();
  test_sequence_form();
  test_stream_formatting_goes_native();
  return 0;
}
