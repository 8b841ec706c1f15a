#include "curses_session.hpp"
#include <locale.h>
#include <cstdio>
#include <ncurses.h>

CursesSession::CursesSession() {
  setlocale(LC_ALL, "");
  SCREEN* s = newterm(nullptr, stdout, stdin);
  if (!s) return;
  set_term(s);
  screen_ = s;
}

CursesSession::~CursesSession() {
  if (!screen_) return;
  endwin();
  delscreen(static_cast<SCREEN*>(screen_));
}
