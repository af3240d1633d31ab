#pragma once

#include <termios.h>

namespace reqnav::cli {

/// Puts stdin into raw mode for its lifetime and restores the previous
/// attributes on destruction.
class TermiosGuard {
 public:
  TermiosGuard();
  ~TermiosGuard();

  TermiosGuard(const TermiosGuard&) = delete;
  TermiosGuard& operator=(const TermiosGuard&) = delete;

  bool ok() const { return ok_; }

 private:
  termios original_{};
  bool ok_ = false;
};

/// Current terminal size, falling back to 80x24 when stdout is not a tty.
int terminal_width();
int terminal_height();

/// Waits up to `timeout_ms` for stdin to become readable.
bool wait_input_ready(int timeout_ms);

}  // namespace reqnav::cli
