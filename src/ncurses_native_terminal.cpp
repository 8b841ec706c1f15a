#include "ncurses_native_terminal.hpp"
#include <algorithm>
#include <ncurses.h>

namespace {

std::error_code curses_result(int rc) {
  return rc == ERR ? std::make_error_code(std::errc::io_error) : std::error_code();
}

// False for attributes curses has no rendition for.
bool curses_attr(Attribute a, attr_t& out) {
  switch (a) {
    case Attribute::Bold:       out = A_BOLD; return true;
    case Attribute::Dim:        out = A_DIM; return true;
    case Attribute::Italic:     out = A_ITALIC; return true;
    case Attribute::Underlined: out = A_UNDERLINE; return true;
    case Attribute::SlowBlink:
    case Attribute::RapidBlink: out = A_BLINK; return true;
    case Attribute::Reverse:    out = A_REVERSE; return true;
    case Attribute::Hidden:     out = A_INVIS; return true;
    default: return false;
  }
}

} // namespace

std::error_code NcursesNativeTerminal::ready() const {
  if (!session_.ok()) return std::make_error_code(std::errc::not_connected);
  return {};
}

std::error_code NcursesNativeTerminal::move_cursor(int row, int col) {
  if (auto ec = ready()) return ec;
  if (move(row, col) == ERR) return std::make_error_code(std::errc::invalid_argument);
  return curses_result(refresh());
}

std::error_code NcursesNativeTerminal::print(std::string_view text) {
  if (auto ec = ready()) return ec;
  if (auto ec = curses_result(addnstr(text.data(), static_cast<int>(text.size())))) return ec;
  return curses_result(refresh());
}

std::error_code NcursesNativeTerminal::apply_attribute(Attribute a) {
  if (auto ec = ready()) return ec;
  Attributes next = ::apply_attribute(active_, a);
  attr_t mask = A_NORMAL;
  for (Attribute member : next) {
    attr_t bit = A_NORMAL;
    if (!curses_attr(member, bit)) return std::make_error_code(std::errc::not_supported);
    mask |= bit;
  }
  if (auto ec = curses_result(attrset(mask))) return ec;
  active_ = next;
  return curses_result(refresh());
}

std::error_code NcursesNativeTerminal::clear_screen(ClearType type) {
  if (auto ec = ready()) return ec;
  int y = 0, x = 0;
  getyx(stdscr, y, x);
  switch (type) {
    case ClearType::All:
      if (erase() == ERR) return std::make_error_code(std::errc::io_error);
      break;
    case ClearType::FromCursorDown:
      if (clrtobot() == ERR) return std::make_error_code(std::errc::io_error);
      break;
    case ClearType::FromCursorUp: {
      for (int r = 0; r < y; ++r) {
        if (move(r, 0) == ERR || clrtoeol() == ERR) return std::make_error_code(std::errc::io_error);
      }
      int cols = getmaxx(stdscr);
      int n = std::min(x + 1, cols);
      // hline leaves the cursor alone, so the bottom-right cell does not trip scrolling
      if (mvhline(y, 0, ' ', n) == ERR) return std::make_error_code(std::errc::io_error);
      if (move(y, x) == ERR) return std::make_error_code(std::errc::io_error);
      break;
    }
    case ClearType::CurrentLine:
      if (move(y, 0) == ERR || clrtoeol() == ERR || move(y, x) == ERR)
        return std::make_error_code(std::errc::io_error);
      break;
    case ClearType::UntilNewLine:
      if (clrtoeol() == ERR) return std::make_error_code(std::errc::io_error);
      break;
  }
  return curses_result(refresh());
}

std::error_code NcursesNativeTerminal::set_cursor_visible(bool visible) {
  if (auto ec = ready()) return ec;
  if (curs_set(visible ? 1 : 0) == ERR) return std::make_error_code(std::errc::not_supported);
  return curses_result(refresh());
}

INativeTerminal& native_terminal() {
  static NcursesNativeTerminal term;
  return term;
}
