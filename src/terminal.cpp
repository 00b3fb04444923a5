#include "pigame/terminal.hpp"

#include "pigame/errors.hpp"
#include "log.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <poll.h>
#include <unistd.h>

namespace pigame {
namespace {

constexpr unsigned char kCtrlC = 0x03;
constexpr unsigned char kCtrlD = 0x04;

std::string errno_message(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

} // namespace

RawModeGuard::RawModeGuard(int fd) : fd_(fd) {
  if (::isatty(fd_) != 1) {
    throw TerminalModeError("Practice mode needs an interactive terminal on stdin");
  }
  if (::tcgetattr(fd_, &original_) != 0) {
    throw TerminalModeError(errno_message("tcgetattr failed"));
  }
  termios raw = original_;
  raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO | ISIG));
  raw.c_iflag &= static_cast<tcflag_t>(~(IXON | ICRNL));
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;
  if (::tcsetattr(fd_, TCSAFLUSH, &raw) != 0) {
    throw TerminalModeError(errno_message("tcsetattr failed"));
  }
  log::debug("terminal", "raw mode on");
}

RawModeGuard::~RawModeGuard() {
  if (::tcsetattr(fd_, TCSAFLUSH, &original_) != 0) {
    log::warning("terminal", errno_message("could not restore terminal mode"));
    return;
  }
  log::debug("terminal", "raw mode off");
}

TerminalKeySource::TerminalKeySource(int fd) : guard_(fd) {}

std::optional<KeyEvent> TerminalKeySource::poll(std::chrono::milliseconds timeout) {
  pollfd pfd{};
  pfd.fd = guard_.fd();
  pfd.events = POLLIN;
  const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (ready < 0) {
    if (errno == EINTR) {
      return std::nullopt;
    }
    throw TerminalModeError(errno_message("poll failed"));
  }
  if (ready == 0) {
    return std::nullopt;
  }
  if ((pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) != 0 && (pfd.revents & POLLIN) == 0) {
    return KeyEvent::interrupt();
  }

  unsigned char byte = 0;
  const ssize_t n = ::read(guard_.fd(), &byte, 1);
  if (n < 0) {
    if (errno == EINTR || errno == EAGAIN) {
      return std::nullopt;
    }
    throw TerminalModeError(errno_message("read failed"));
  }
  if (n == 0 || byte == kCtrlC || byte == kCtrlD) {
    return KeyEvent::interrupt();
  }
  return KeyEvent::key(static_cast<char>(byte));
}

} // namespace pigame
