#pragma once

#include "session_engine.hpp"

#include <chrono>
#include <optional>

#include <termios.h>

namespace pigame {

// Puts a terminal into unbuffered, no-echo input mode and restores the
// original settings on destruction. Signal keys are delivered as bytes, so
// Ctrl-C reaches the reader instead of killing the process. A SIGTERM or
// SIGHUP from outside still terminates without restoring the settings.
class RawModeGuard {
public:
  // Throws TerminalModeError when `fd` is not a terminal or cannot be
  // reconfigured.
  explicit RawModeGuard(int fd);
  ~RawModeGuard();

  RawModeGuard(const RawModeGuard&) = delete;
  RawModeGuard& operator=(const RawModeGuard&) = delete;

  int fd() const noexcept { return fd_; }

private:
  int fd_;
  termios original_{};
};

// Keystrokes from a terminal file descriptor, read one byte at a time
// under poll(2). Ctrl-C, Ctrl-D and end of input map to Interrupt.
class TerminalKeySource : public KeySource {
public:
  explicit TerminalKeySource(int fd);

  std::optional<KeyEvent> poll(std::chrono::milliseconds timeout) override;

private:
  RawModeGuard guard_;
};

} // namespace pigame
