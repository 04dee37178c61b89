#include "terminal.hpp"
#include <locale.h>

Terminal::Terminal(bool mouse) {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
  if (mouse) {
    mousemask(ALL_MOUSE_EVENTS | REPORT_MOUSE_POSITION, nullptr);
    mouseinterval(0);
  }
}

Terminal::~Terminal() {
  endwin();
}
