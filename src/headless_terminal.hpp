#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: INativeTerminal that records native calls instead of touching a screen.
 * Usage: automated tests of the native fallback path; inspect calls()/state afterwards.
 * Failure injection: fail_next(ec) makes the next call fail without recording it.
 */
#include <string>
#include <vector>
#include "native_terminal.hpp"
#include "attributes.hpp"

class HeadlessTerminal : public INativeTerminal {
public:
  std::error_code move_cursor(int row, int col) override;
  std::error_code print(std::string_view text) override;
  std::error_code apply_attribute(Attribute a) override;
  std::error_code clear_screen(ClearType type) override;
  std::error_code set_cursor_visible(bool visible) override;

  void fail_next(std::error_code ec = std::make_error_code(std::errc::io_error)) { pending_failure_ = ec; }

  const std::vector<std::string>& calls() const { return calls_; }
  const std::string& printed() const { return printed_; }
  CursorPos cursor() const { return cursor_; }
  bool cursor_visible() const { return cursor_visible_; }
  const Attributes& active_attributes() const { return active_; }

private:
  std::error_code take_failure();

  std::vector<std::string> calls_;
  std::string printed_;
  CursorPos cursor_;
  bool cursor_visible_ = true;
  Attributes active_;
  std::error_code pending_failure_;
};
