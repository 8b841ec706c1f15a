#include "ansi_support.hpp"
#include <cassert>
#include <cstdlib>

static void test_parse_ansi_mode() {
  assert(parse_ansi_mode("auto") == AnsiMode::Auto);
  assert(parse_ansi_mode("AUTO") == AnsiMode::Auto);
  assert(parse_ansi_mode("yes") == AnsiMode::Always);
  assert(parse_ansi_mode("Always") == AnsiMode::Always);
  assert(parse_ansi_mode("no") == AnsiMode::Never);
  assert(parse_ansi_mode("never") == AnsiMode::Never);
  assert(!parse_ansi_mode("").has_value());
  assert(!parse_ansi_mode("maybe").has_value());
}

static void test_detect_ansi_support() {
  assert(detect_ansi_support(AnsiMode::Always, "dumb"));
  assert(!detect_ansi_support(AnsiMode::Never, "xterm-256color"));
  assert(detect_ansi_support(AnsiMode::Auto, "xterm-256color"));
  assert(detect_ansi_support(AnsiMode::Auto, "linux"));
  assert(!detect_ansi_support(AnsiMode::Auto, "dumb"));
  assert(!detect_ansi_support(AnsiMode::Auto, "DUMB"));
  assert(detect_ansi_support(AnsiMode::Auto, nullptr));
  assert(detect_ansi_support(AnsiMode::Auto, ""));
}

static void test_cached_decision() {
  // invalid override falls back to the compile-time default
  setenv("TERMCMD_ANSI", "sometimes", 1);
  setenv("TERM", "xterm", 1);
  bool first = ansi_supported();
  assert(first == detect_ansi_support(default_ansi_mode(), "xterm"));
  setenv("TERMCMD_ANSI", first ? "never" : "always", 1);
  assert(ansi_supported() == first);
}

int main() {
  test_parse_ansi_mode();
  test_detect_ansi_support();
  test_cached_decision();
  return 0;
}
