#pragma once
/*
 * NcursesNativeTerminal
 *
 * Purpose: INativeTerminal implementation driving the screen through ncurses.
 * Note: every call refreshes, so effects are immediate (no queuing on this path).
 * Note: ncurses.h stays in the .cpp; its function-like macros clash with common names.
 */
#include "native_terminal.hpp"
#include "curses_session.hpp"
#include "attributes.hpp"

class NcursesNativeTerminal : public INativeTerminal {
public:
  NcursesNativeTerminal() = default;
  std::error_code move_cursor(int row, int col) override;
  std::error_code print(std::string_view text) override;
  std::error_code apply_attribute(Attribute a) override;
  std::error_code clear_screen(ClearType type) override;
  std::error_code set_cursor_visible(bool visible) override;
private:
  std::error_code ready() const;
  CursesSession session_;
  Attributes active_;
};
