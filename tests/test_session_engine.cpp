#include "pigame/digit_source.hpp"
#include "pigame/errors.hpp"
#include "pigame/session_engine.hpp"
#include "pigame/stats_store.hpp"
#include "pigame/terminal.hpp"

#include "test_suite.hpp"

#include <chrono>
#include <deque>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace {

// Replays a fixed list of events; once drained it either reports an
// interrupt or waits out the timeout like an idle keyboard.
class ScriptedKeySource : public pigame::KeySource {
public:
  ScriptedKeySource(std::deque<pigame::KeyEvent> events, bool interrupt_when_drained,
                    bool* released = nullptr)
      : events_(std::move(events)),
        interrupt_when_drained_(interrupt_when_drained),
        released_(released) {}

  ~ScriptedKeySource() override {
    if (released_) {
      *released_ = true;
    }
  }

  std::optional<pigame::KeyEvent> poll(std::chrono::milliseconds timeout) override {
    ++polls;
    if (!events_.empty()) {
      auto event = events_.front();
      events_.pop_front();
      return event;
    }
    if (interrupt_when_drained_) {
      return pigame::KeyEvent::interrupt();
    }
    std::this_thread::sleep_for(timeout);
    return std::nullopt;
  }

  int polls = 0;

private:
  std::deque<pigame::KeyEvent> events_;
  bool interrupt_when_drained_;
  bool* released_;
};

std::deque<pigame::KeyEvent> keys(const std::string& text) {
  std::deque<pigame::KeyEvent> out;
  for (char c : text) {
    out.push_back(pigame::KeyEvent::key(c));
  }
  return out;
}

pigame::KeySourceFactory scripted(const std::string& text, bool interrupt_when_drained = true,
                                  bool* released = nullptr) {
  return [text, interrupt_when_drained, released]() -> std::unique_ptr<pigame::KeySource> {
    return std::make_unique<ScriptedKeySource>(keys(text), interrupt_when_drained, released);
  };
}

pigame::PracticeConfig make_config(pigame::PracticeMode mode, int min_digits, int max_digits) {
  pigame::PracticeConfig config;
  config.mode = mode;
  config.min_digits = min_digits;
  config.max_digits = max_digits;
  return config;
}

struct RecordingObserver : pigame::SessionObserver {
  int started = 0;
  int start_digits = 0;
  std::string digits;
  std::vector<int> targets;
  std::vector<int> checkpoints;
  std::vector<pigame::Mismatch> mismatches;
  std::vector<pigame::SessionRecord> ended;

  void on_start(const pigame::PracticeConfig&, int start) override {
    ++started;
    start_digits = start;
  }
  void on_digit(char digit, int) override { digits.push_back(digit); }
  void on_target_reached(int achieved) override { targets.push_back(achieved); }
  void on_checkpoint(int achieved, int) override { checkpoints.push_back(achieved); }
  void on_mismatch(const pigame::Mismatch& mismatch, int) override {
    mismatches.push_back(mismatch);
  }
  void on_end(const pigame::SessionRecord& record) override { ended.push_back(record); }
};

// Holds the session up before the first poll, so the deadline passes with
// keys already buffered.
struct SlowStartObserver : pigame::SessionObserver {
  std::chrono::milliseconds delay{0};
  void on_start(const pigame::PracticeConfig&, int) override {
    std::this_thread::sleep_for(delay);
  }
};

// Hands out one key only after waiting the whole slice, like a keystroke
// that lands right as the timer runs out.
class LateKeySource : public pigame::KeySource {
public:
  explicit LateKeySource(char key) : key_(key) {}

  std::optional<pigame::KeyEvent> poll(std::chrono::milliseconds timeout) override {
    std::this_thread::sleep_for(timeout);
    if (delivered_) {
      return std::nullopt;
    }
    delivered_ = true;
    return pigame::KeyEvent::key(key_);
  }

private:
  char key_;
  bool delivered_ = false;
};

// Checks that the key source was released before the record was stored.
class OrderCheckingStats : public pigame::StatsRepository {
public:
  explicit OrderCheckingStats(const bool& released) : released_(released) {}

  std::vector<pigame::SessionRecord> load() override { return history; }
  void append(const pigame::SessionRecord& record) override {
    released_before_append = released_;
    history.push_back(record);
  }

  std::vector<pigame::SessionRecord> history;
  bool released_before_append = false;

private:
  const bool& released_;
};

class FailingStats : public pigame::StatsRepository {
public:
  std::vector<pigame::SessionRecord> load() override { return {}; }
  void append(const pigame::SessionRecord&) override {
    throw pigame::StorageError("disk full");
  }
};

} // namespace

int main() {
  using namespace std::chrono_literals;
  pigame::testing::TestSuite suite;
  const std::string pi(pigame::DigitSource::digits(100));

  {
    pigame::InMemoryStatsRepository stats;
    pigame::PracticeEngine engine(stats, scripted(pi.substr(0, 10)));
    RecordingObserver observer;
    const auto record =
        engine.run(make_config(pigame::PracticeMode::Standard, 5, 10), &observer);
    suite.require(record.success, "All correct digits up to max should succeed");
    suite.require(record.digits_achieved == 10, "Completed session should reach max_digits");
    suite.require(record.end == pigame::SessionEnd::Completed, "End reason should be completed");
    suite.require(record.error_count == 0, "No errors in a perfect session");
    suite.require(stats.load().size() == 1, "Exactly one record should be appended");
    suite.require(observer.ended.size() == 1, "Observer should see exactly one end");
    suite.require(observer.digits == pi.substr(0, 10), "Observer should see every digit");
    suite.require(!record.timestamp.empty() && record.timestamp.back() == 'Z',
                  "Timestamp should be ISO-8601 UTC");
  }

  {
    pigame::InMemoryStatsRepository stats;
    // Wrong digit at index 3: '5' is expected, '0' is typed.
    pigame::PracticeEngine engine(stats, scripted("1410926"));
    RecordingObserver observer;
    const auto record =
        engine.run(make_config(pigame::PracticeMode::Standard, 5, 50), &observer);
    suite.require(!record.success, "A wrong digit should fail the session");
    suite.require(record.digits_achieved == 3, "digits_achieved should equal the wrong index");
    suite.require(record.error_count == 1, "The wrong digit should be recorded");
    suite.require(record.end == pigame::SessionEnd::Mismatch, "End reason should be mismatch");
    suite.require(observer.mismatches.size() == 1 && observer.mismatches[0].expected == '5' &&
                      observer.mismatches[0].actual == '0',
                  "Observer should see the mismatch");
    suite.require(observer.digits == "141", "Digits after the mismatch are not consumed");
  }

  {
    pigame::InMemoryStatsRepository stats;
    pigame::PracticeEngine engine(stats, scripted("1x4 .1\r"));
    const auto record = engine.run(make_config(pigame::PracticeMode::Standard, 5, 50));
    suite.require(record.digits_achieved == 3, "Non-digit keys should be ignored");
    suite.require(record.end == pigame::SessionEnd::Interrupted && !record.success,
                  "Interrupt should end the session unsuccessfully");
    suite.require(stats.load().size() == 1 && stats.load()[0].digits_achieved == 3,
                  "Interrupted session should persist a partial record");
  }

  {
    pigame::InMemoryStatsRepository stats;
    pigame::PracticeEngine engine(stats, scripted(pi.substr(0, 10)));
    RecordingObserver observer;
    auto config = make_config(pigame::PracticeMode::Chunk, 1, 50);
    config.chunk_size = 3;
    const auto record = engine.run(config, &observer);
    suite.require(record.digits_achieved == 10, "Chunk session should count every digit");
    suite.require(observer.checkpoints == std::vector<int>({3, 6, 9}),
                  "Chunk mode should checkpoint every chunk_size digits");
  }

  {
    pigame::PracticeSession session(make_config(pigame::PracticeMode::Chunk, 1, 6), 1);
    suite.require(session.state() == pigame::SessionState::Idle, "Sessions begin idle");
    auto now = pigame::SessionClock::now();
    session.start(now);
    suite.require(session.state() == pigame::SessionState::AwaitingDigit,
                  "Started session awaits a digit");
    for (char c : pi.substr(0, 6)) {
      session.handle_key(c, now);
    }
    suite.require(session.ended() && session.record().success,
                  "Reaching max_digits on a chunk boundary should complete");
    session.handle_key('9', now);
    session.handle_interrupt(now);
    suite.require(session.record().digits_achieved == 6 && session.record().success,
                  "Events after the end should be ignored");
  }

  {
    pigame::PracticeSession session(make_config(pigame::PracticeMode::Standard, 1, 5), 1);
    bool threw = false;
    try {
      session.record();
    } catch (const std::logic_error&) {
      threw = true;
    }
    suite.require(threw, "record() before the end should throw");
  }

  {
    pigame::InMemoryStatsRepository stats;
    auto config = make_config(pigame::PracticeMode::Timed, 5, 50);
    config.time_limit_seconds = 0.001;
    pigame::PracticeEngine engine(stats, scripted("", false));
    const auto started = std::chrono::steady_clock::now();
    const auto record = engine.run(config);
    const auto took = std::chrono::steady_clock::now() - started;
    suite.require(record.end == pigame::SessionEnd::Timeout, "Idle timed session should time out");
    suite.require(!record.success && record.digits_achieved == 0,
                  "Timed-out session should fail with zero digits");
    suite.require(took < 2s, "Timeout should end the session within bounded latency");
    suite.require(stats.load().size() == 1, "Timeout should persist one record");
  }

  {
    pigame::InMemoryStatsRepository stats;
    auto config = make_config(pigame::PracticeMode::Timed, 5, 50);
    config.time_limit_seconds = 0.2;
    pigame::PracticeEngine engine(stats, scripted(pi.substr(0, 4), false));
    const auto record = engine.run(config);
    suite.require(record.end == pigame::SessionEnd::Timeout,
                  "Timed session should time out after the keys stop");
    suite.require(record.digits_achieved == 4, "Keys before expiry should be counted");
  }

  {
    pigame::InMemoryStatsRepository stats;
    auto config = make_config(pigame::PracticeMode::Timed, 5, 50);
    config.time_limit_seconds = 0.01;
    pigame::PracticeEngine engine(stats, scripted(pi.substr(0, 2), false));
    SlowStartObserver observer;
    observer.delay = 30ms;
    const auto record = engine.run(config, &observer);
    suite.require(record.end == pigame::SessionEnd::Timeout,
                  "Buffered keys should not stop the timeout");
    suite.require(record.digits_achieved == 2,
                  "Keys buffered before the deadline should be scored first");
  }

  {
    auto config = make_config(pigame::PracticeMode::Timed, 1, 50);
    config.time_limit_seconds = 0.005;
    int scored = 0;
    for (int run = 0; run < 20; ++run) {
      pigame::PracticeSession session(config, 1);
      LateKeySource late(pi[0]);
      session.start(pigame::SessionClock::now());
      pigame::drive_session(session, late);
      if (session.record().end == pigame::SessionEnd::Timeout &&
          session.record().digits_achieved == 1) {
        ++scored;
      }
    }
    suite.require(scored == 20, "A key returned at the deadline should always be scored");
  }

  {
    auto config = make_config(pigame::PracticeMode::Timed, 1, 50);
    config.time_limit_seconds = 1.0;
    pigame::PracticeSession session(config, 1);
    const auto t0 = pigame::SessionClock::now();
    session.start(t0);
    suite.require(session.deadline().has_value(), "Timed session should have a deadline");
    session.handle_key(pi[0], t0 + 500ms);
    session.handle_timeout(t0 + 900ms);
    suite.require(!session.ended(), "Timeout before the deadline should be ignored");
    session.handle_timeout(t0 + 1001ms);
    suite.require(session.ended() && session.record().end == pigame::SessionEnd::Timeout,
                  "Timeout after the deadline should end the session");
    suite.require(session.record().digits_achieved == 1, "Digit before expiry should count");
    suite.require(session.record().elapsed_seconds > 1.0, "Elapsed time should span the session");
  }

  {
    pigame::PracticeSession session(make_config(pigame::PracticeMode::Standard, 1, 50), 1);
    const auto t0 = pigame::SessionClock::now();
    session.start(t0);
    session.handle_timeout(t0 + 10h);
    suite.require(!session.ended(), "Untimed sessions never time out");
  }

  {
    pigame::InMemoryStatsRepository stats;
    pigame::SessionRecord best;
    best.timestamp = "2025-01-01T00:00:00Z";
    best.digits_achieved = 4;
    stats.append(best);
    pigame::PracticeEngine engine(stats, scripted(pi.substr(0, 6)));
    RecordingObserver observer;
    engine.run(make_config(pigame::PracticeMode::Standard, 2, 10), &observer);
    suite.require(observer.start_digits == 4, "Start target should follow the historical best");
    suite.require(observer.targets == std::vector<int>({4}),
                  "Reaching the target should be announced once");
    suite.require(engine.start_digits_for(make_config(pigame::PracticeMode::Standard, 2, 10)) == 6,
                  "Next target should rise to the new best");
  }

  {
    bool released = false;
    OrderCheckingStats stats(released);
    pigame::PracticeEngine engine(stats, scripted(pi.substr(0, 3), true, &released));
    engine.run(make_config(pigame::PracticeMode::Standard, 1, 10));
    suite.require(stats.history.size() == 1, "Record should be appended");
    suite.require(stats.released_before_append,
                  "Key source should be released before the record is stored");
  }

  {
    FailingStats stats;
    pigame::PracticeEngine engine(stats, scripted(pi.substr(0, 5)));
    bool returned = false;
    try {
      const auto record = engine.run(make_config(pigame::PracticeMode::Standard, 1, 5));
      returned = record.success;
    } catch (const pigame::StorageError&) {
      returned = false;
    }
    suite.require(returned, "A failed append should not lose the session result");
  }

  {
    pigame::InMemoryStatsRepository stats;
    pigame::PracticeEngine engine(stats, []() -> std::unique_ptr<pigame::KeySource> {
      throw pigame::TerminalModeError("stdin is not a terminal");
    });
    bool threw = false;
    try {
      engine.run(make_config(pigame::PracticeMode::Standard, 1, 5));
    } catch (const pigame::TerminalModeError&) {
      threw = true;
    }
    suite.require(threw, "Terminal errors should reach the caller");
    suite.require(stats.load().empty(), "No record without a started session");
  }

  {
    pigame::InMemoryStatsRepository stats;
    pigame::PracticeEngine engine(stats, scripted("1"));
    auto config = make_config(pigame::PracticeMode::Standard, 9, 3);
    bool threw = false;
    try {
      engine.run(config);
    } catch (const pigame::InvalidConfig&) {
      threw = true;
    }
    suite.require(threw, "Invalid configs should be rejected before the session starts");
  }

  {
    const int fd = ::open("/dev/null", O_RDONLY);
    bool threw = false;
    try {
      pigame::RawModeGuard guard(fd);
    } catch (const pigame::TerminalModeError&) {
      threw = true;
    }
    if (fd >= 0) {
      ::close(fd);
    }
    suite.require(threw, "Raw mode on a non-terminal should fail");
  }

  return suite.finish("Session engine");
}
