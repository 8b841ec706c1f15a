#include "commands.hpp"

static CommandError native_result(std::error_code ec, const char* what) {
  if (ec) return CommandError::native(ec, what);
  return {};
}

static std::string sgr(Attribute a) {
  return TERMCMD_CSI + std::to_string(sgr_code(a)) + "m";
}

CommandError Print::perform_native(INativeTerminal& native, const FallbackWriter&) const {
  return native_result(native.print(text_), "native print failed");
}

std::string MoveTo::render() const {
  return TERMCMD_CSI + std::to_string(row_ + 1) + ";" + std::to_string(col_ + 1) + "H";
}

CommandError MoveTo::perform_native(INativeTerminal& native, const FallbackWriter&) const {
  return native_result(native.move_cursor(row_, col_), "native move cursor failed");
}

CommandError HideCursor::perform_native(INativeTerminal& native, const FallbackWriter&) const {
  return native_result(native.set_cursor_visible(false), "native hide cursor failed");
}

CommandError ShowCursor::perform_native(INativeTerminal& native, const FallbackWriter&) const {
  return native_result(native.set_cursor_visible(true), "native show cursor failed");
}

std::string Clear::render() const {
  switch (type_) {
    case ClearType::All: return TERMCMD_CSI "2J";
    case ClearType::FromCursorDown: return TERMCMD_CSI "J";
    case ClearType::FromCursorUp: return TERMCMD_CSI "1J";
    case ClearType::CurrentLine: return TERMCMD_CSI "2K";
    case ClearType::UntilNewLine: return TERMCMD_CSI "K";
  }
  return std::string();
}

CommandError Clear::perform_native(INativeTerminal& native, const FallbackWriter&) const {
  return native_result(native.clear_screen(type_), "native clear failed");
}

std::string SetAttribute::render() const { return sgr(attr_); }

CommandError SetAttribute::perform_native(INativeTerminal& native, const FallbackWriter&) const {
  return native_result(native.apply_attribute(attr_), "native set attribute failed");
}

std::string SetAttributes::render() const {
  std::string out;
  for (Attribute a : attrs_) out += sgr(a);
  return out;
}

CommandError SetAttributes::perform_native(INativeTerminal& native, const FallbackWriter&) const {
  for (Attribute a : attrs_) {
    if (auto ec = native.apply_attribute(a))
      return CommandError::native(ec, "native set attribute failed: " + std::string(attribute_name(a)));
  }
  return {};
}
