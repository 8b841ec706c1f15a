#include "headless_terminal.hpp"

static const char* clear_type_name(ClearType type) {
  switch (type) {
    case ClearType::All: return "all";
    case ClearType::FromCursorDown: return "down";
    case ClearType::FromCursorUp: return "up";
    case ClearType::CurrentLine: return "line";
    case ClearType::UntilNewLine: return "eol";
  }
  return "?";
}

std::error_code HeadlessTerminal::take_failure() {
  std::error_code ec = pending_failure_;
  pending_failure_.clear();
  return ec;
}

std::error_code HeadlessTerminal::move_cursor(int row, int col) {
  if (auto ec = take_failure()) return ec;
  if (row < 0 || col < 0) return std::make_error_code(std::errc::invalid_argument);
  cursor_ = {row, col};
  calls_.push_back("move " + std::to_string(row) + "," + std::to_string(col));
  return {};
}

std::error_code HeadlessTerminal::print(std::string_view text) {
  if (auto ec = take_failure()) return ec;
  printed_.append(text.data(), text.size());
  cursor_.col += static_cast<int>(text.size());
  calls_.push_back("print " + std::string(text));
  return {};
}

std::error_code HeadlessTerminal::apply_attribute(Attribute a) {
  if (auto ec = take_failure()) return ec;
  active_ = ::apply_attribute(active_, a);
  calls_.push_back("attr " + std::string(attribute_name(a)));
  return {};
}

std::error_code HeadlessTerminal::clear_screen(ClearType type) {
  if (auto ec = take_failure()) return ec;
  calls_.push_back(std::string("clear ") + clear_type_name(type));
  return {};
}

std::error_code HeadlessTerminal::set_cursor_visible(bool visible) {
  if (auto ec = take_failure()) return ec;
  cursor_visible_ = visible;
  calls_.push_back(visible ? "cursor show" : "cursor hide");
  return {};
}
