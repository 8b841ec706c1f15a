#pragma once
/*
 * INativeTerminal
 *
 * Purpose: synchronous native call surface used when escape sequences are unsupported.
 * Contract: each call applies immediately and atomically, or fails with an error_code.
 * Impls: NcursesNativeTerminal (process screen), HeadlessTerminal (recording, tests).
 */
#include <string_view>
#include <system_error>
#include "attribute.hpp"
#include "types.hpp"

class INativeTerminal {
public:
  virtual ~INativeTerminal() = default;
  virtual std::error_code move_cursor(int row, int col) = 0;
  virtual std::error_code print(std::string_view text) = 0;
  virtual std::error_code apply_attribute(Attribute a) = 0;
  virtual std::error_code clear_screen(ClearType type) = 0;
  virtual std::error_code set_cursor_visible(bool visible) = 0;
};

// Process-wide ncurses terminal, created on first use.
INativeTerminal& native_terminal();
