#pragma once

#include "diff_engine.hpp"
#include "stats_store.hpp"
#include "types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace pigame {

using SessionClock = std::chrono::steady_clock;

struct KeyEvent {
  enum class Kind {
    Key,
    Interrupt
  };

  Kind kind = Kind::Key;
  char ch = '\0';

  static KeyEvent key(char c) { return KeyEvent{Kind::Key, c}; }
  static KeyEvent interrupt() { return KeyEvent{Kind::Interrupt, '\0'}; }
};

class KeySource {
public:
  virtual ~KeySource() = default;

  // Waits at most `timeout` for one event; nullopt when none arrived.
  virtual std::optional<KeyEvent> poll(std::chrono::milliseconds timeout) = 0;
};

class SessionObserver {
public:
  virtual ~SessionObserver() = default;

  virtual void on_start(const PracticeConfig& /*config*/, int /*start_digits*/) {}
  virtual void on_digit(char /*digit*/, int /*digits_achieved*/) {}
  virtual void on_target_reached(int /*digits_achieved*/) {}
  virtual void on_checkpoint(int /*digits_achieved*/, int /*chunk_index*/) {}
  virtual void on_mismatch(const Mismatch& /*mismatch*/, int /*position*/) {}
  virtual void on_end(const SessionRecord& /*record*/) {}
};

enum class SessionState {
  Idle,
  AwaitingDigit,
  ChunkCheckpoint,
  Ended
};

std::string to_string(SessionState state);

// One practice round. Event driven: the caller feeds keystrokes, interrupts
// and timeouts together with the time they were observed.
class PracticeSession {
public:
  // Throws InvalidConfig for an invalid config.
  PracticeSession(PracticeConfig config, int start_digits, SessionObserver* observer = nullptr);

  void start(SessionClock::time_point now);

  // Digits are compared at the current position; anything else is ignored.
  void handle_key(char key, SessionClock::time_point now);
  void handle_interrupt(SessionClock::time_point now);
  // Ignored unless the session is timed and the deadline has passed.
  void handle_timeout(SessionClock::time_point now);

  SessionState state() const noexcept { return state_; }
  bool ended() const noexcept { return state_ == SessionState::Ended; }
  int digits_achieved() const noexcept { return digits_achieved_; }
  int start_digits() const noexcept { return start_digits_; }
  int checkpoints() const noexcept { return checkpoints_; }
  const PracticeConfig& config() const noexcept { return config_; }
  std::optional<SessionClock::time_point> deadline() const noexcept { return deadline_; }

  // Throws std::logic_error before the session has ended.
  const SessionRecord& record() const;

private:
  void finish(SessionEnd end, SessionClock::time_point now);

  PracticeConfig config_;
  int start_digits_ = 0;
  SessionObserver* observer_ = nullptr;
  StreamingComparator comparator_;
  SessionState state_ = SessionState::Idle;
  int digits_achieved_ = 0;
  int checkpoints_ = 0;
  bool target_announced_ = false;
  SessionClock::time_point started_at_{};
  std::optional<SessionClock::time_point> deadline_;
  std::optional<SessionRecord> record_;
};

// Upper bound on a single key-source wait, so a timed session notices its
// deadline promptly.
inline constexpr std::chrono::milliseconds kMaxPollSlice{1000};

// Drives a started session from `keys` until it ends.
void drive_session(PracticeSession& session, KeySource& keys);

using KeySourceFactory = std::function<std::unique_ptr<KeySource>()>;

class PracticeEngine {
public:
  PracticeEngine(StatsRepository& stats, KeySourceFactory open_keys);

  int start_digits_for(const PracticeConfig& config);

  // Runs one session and appends its record. The key source, and with it
  // the terminal mode, is released before the record is stored. A failed
  // append is logged; the record is returned either way.
  SessionRecord run(const PracticeConfig& config, SessionObserver* observer = nullptr);

private:
  StatsRepository& stats_;
  KeySourceFactory open_keys_;
};

// UTC, second resolution: 2024-03-14T15:09:26Z.
std::string iso8601_utc(std::chrono::system_clock::time_point when);

} // namespace pigame
