/**
 * OS-dependent keyboard scanner (single key poll).
 * Windows: _kbhit/_getch
 * POSIX: termios raw (no echo, no canonical mode, no signals) + select + read
 */
#pragma once

#include <memory>

class Scanner {
public:
  // Puts the terminal into key-at-a-time mode; the destructor restores it.
  Scanner();
  ~Scanner();

  Scanner(const Scanner&) = delete;
  Scanner& operator=(const Scanner&) = delete;

  // Waits up to ~10ms. Returns -1 if no key; otherwise the byte value (0..255).
  int poll();

  // False when stdin is not a terminal (piped input); poll() still reads bytes.
  bool interactive() const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl;
};
