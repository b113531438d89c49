/**
 * Windows implementation of Scanner
 */
#include "../os_dependent/Scanner.hpp"

#if defined(_WIN32)
#include <conio.h>
#include <io.h>
#include <stdio.h>
#include <windows.h>

struct Scanner::Impl {
  bool tty{false};

  Impl() : tty(_isatty(_fileno(stdin)) != 0) {}

  int poll() {
    if (_kbhit()) {
      int ch = _getch();
      if (ch == '\r') ch = '\n'; // map CR to NL
      if (ch == 0 || ch == 0xE0) {
        // Extended key (arrows, F-keys): swallow the second byte.
        _getch();
        return -1;
      }
      return ch;
    }
    Sleep(10);
    return -1;
  }
};

Scanner::Scanner() : impl(std::make_unique<Impl>()) {}
Scanner::~Scanner() = default;
int Scanner::poll() { return impl->poll(); }
bool Scanner::interactive() const { return impl->tty; }

#endif
