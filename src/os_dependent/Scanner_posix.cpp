/**
 * POSIX implementation of Scanner
 */
#include "../os_dependent/Scanner.hpp"

#if !defined(_WIN32)
#include <termios.h>
#include <unistd.h>
#include <sys/select.h>
#include <sys/time.h>

struct Scanner::Impl {
  termios old{};
  bool tty{false};
  bool eof{false};

  Impl() {
    if (isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &old) == 0) {
      termios raw = old;
      // ISIG off: Ctrl+C arrives as byte 3 so the keyboard handler can shut down cleanly.
      raw.c_lflag &= ~(ICANON | ECHO | ISIG);
      raw.c_cc[VMIN]  = 0;
      raw.c_cc[VTIME] = 0;
      tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
      tty = true;
    }
  }
  ~Impl() {
    if (tty) tcsetattr(STDIN_FILENO, TCSAFLUSH, &old);
  }
  int poll() {
    if (eof) {
      // Piped input ran out: behave like Ctrl+D.
      return 4;
    }
    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(STDIN_FILENO, &fds);
    timeval tv{};
    tv.tv_sec = 0; tv.tv_usec = 10000; // 10ms
    int r = select(STDIN_FILENO + 1, &fds, nullptr, nullptr, &tv);
    if (r > 0 && FD_ISSET(STDIN_FILENO, &fds)) {
      unsigned char c;
      ssize_t n = ::read(STDIN_FILENO, &c, 1);
      if (n == 1) return static_cast<int>(c);
      if (n == 0 && !tty) eof = true;
    }
    return -1;
  }
};

Scanner::Scanner() : impl(std::make_unique<Impl>()) {}
Scanner::~Scanner() = default;
int Scanner::poll() { return impl->poll(); }
bool Scanner::interactive() const { return impl->tty; }

#endif
