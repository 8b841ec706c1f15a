#pragma once
/*
 * CursesSession
 *
 * Purpose: RAII wrapper around ncurses screen setup/teardown for the native path.
 * Usage: owned by NcursesNativeTerminal; destructor restores the terminal.
 * Note: output only; raw/noecho/keypad input modes are left untouched.
 */

class CursesSession {
public:
  CursesSession();
  ~CursesSession();
  CursesSession(const CursesSession&) = delete;
  CursesSession& operator=(const CursesSession&) = delete;
  bool ok() const { return screen_ != nullptr; }
private:
  void* screen_ = nullptr; // SCREEN*, kept opaque so ncurses macros stay out of headers
};
