#include "pigame/session_engine.hpp"

#include "pigame/difficulty.hpp"
#include "pigame/digit_source.hpp"
#include "pigame/errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>
#include <utility>
#include <variant>

namespace pigame {
namespace {

PracticeConfig validated(PracticeConfig config) {
  config.validate();
  return config;
}

// Zero once the deadline has passed so pending input is drained, not waited for.
std::chrono::milliseconds poll_timeout(const PracticeSession& session, SessionClock::time_point now) {
  const auto deadline = session.deadline();
  if (!deadline.has_value()) {
    return kMaxPollSlice;
  }
  if (now >= *deadline) {
    return std::chrono::milliseconds(0);
  }
  const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(*deadline - now);
  return std::clamp(remaining, std::chrono::milliseconds(1), kMaxPollSlice);
}

} // namespace

std::string to_string(SessionState state) {
  switch (state) {
    case SessionState::Idle: return "idle";
    case SessionState::AwaitingDigit: return "awaiting_digit";
    case SessionState::ChunkCheckpoint: return "chunk_checkpoint";
    case SessionState::Ended: return "ended";
  }
  return "idle";
}

std::string iso8601_utc(std::chrono::system_clock::time_point when) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char buffer[32];
  const auto written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(buffer, written);
}

PracticeSession::PracticeSession(PracticeConfig config, int start_digits, SessionObserver* observer)
    : config_(validated(std::move(config))),
      start_digits_(std::clamp(start_digits, config_.min_digits, config_.max_digits)),
      observer_(observer),
      comparator_(DigitSource::digits(config_.max_digits)) {}

void PracticeSession::start(SessionClock::time_point now) {
  if (state_ != SessionState::Idle) {
    throw std::logic_error("Practice session already started");
  }
  started_at_ = now;
  if (config_.mode == PracticeMode::Timed) {
    deadline_ = now + std::chrono::duration_cast<SessionClock::duration>(
                          std::chrono::duration<double>(config_.time_limit_seconds));
  }
  state_ = SessionState::AwaitingDigit;
  log::debug("session", "start mode=" + to_string(config_.mode) +
                            " target=" + std::to_string(start_digits_) +
                            " max=" + std::to_string(config_.max_digits));
  if (observer_) {
    observer_->on_start(config_, start_digits_);
  }
}

void PracticeSession::handle_key(char key, SessionClock::time_point now) {
  if (state_ != SessionState::AwaitingDigit) {
    return;
  }
  if (!std::isdigit(static_cast<unsigned char>(key))) {
    return;
  }

  const int position = digits_achieved_;
  const auto step = comparator_.feed(key);
  if (const auto* mismatch = std::get_if<Mismatch>(&step)) {
    if (observer_) {
      observer_->on_mismatch(*mismatch, position);
    }
    finish(SessionEnd::Mismatch, now);
    return;
  }

  ++digits_achieved_;
  if (observer_) {
    observer_->on_digit(key, digits_achieved_);
  }
  if (digits_achieved_ == config_.max_digits) {
    finish(SessionEnd::Completed, now);
    return;
  }
  if (!target_announced_ && digits_achieved_ == start_digits_) {
    target_announced_ = true;
    if (observer_) {
      observer_->on_target_reached(digits_achieved_);
    }
  }
  if (config_.mode == PracticeMode::Chunk && digits_achieved_ % config_.chunk_size == 0) {
    state_ = SessionState::ChunkCheckpoint;
    ++checkpoints_;
    if (observer_) {
      observer_->on_checkpoint(digits_achieved_, checkpoints_);
    }
    state_ = SessionState::AwaitingDigit;
  }
}

void PracticeSession::handle_interrupt(SessionClock::time_point now) {
  if (state_ == SessionState::Ended) {
    return;
  }
  finish(SessionEnd::Interrupted, now);
}

void PracticeSession::handle_timeout(SessionClock::time_point now) {
  if (state_ != SessionState::AwaitingDigit || !deadline_.has_value() || now < *deadline_) {
    return;
  }
  finish(SessionEnd::Timeout, now);
}

const SessionRecord& PracticeSession::record() const {
  if (!record_.has_value()) {
    throw std::logic_error("Practice session has not ended");
  }
  return *record_;
}

void PracticeSession::finish(SessionEnd end, SessionClock::time_point now) {
  if (state_ == SessionState::Idle) {
    started_at_ = now;
  }
  state_ = SessionState::Ended;

  SessionRecord record;
  record.timestamp = iso8601_utc(std::chrono::system_clock::now());
  record.mode = config_.mode;
  record.digits_achieved = digits_achieved_;
  record.elapsed_seconds = std::chrono::duration<double>(now - started_at_).count();
  record.error_count = comparator_.error_count();
  record.success = end == SessionEnd::Completed;
  record.end = end;
  record.target_digits = start_digits_;
  record_ = std::move(record);

  log::debug("session", "end reason=" + to_string(end) +
                            " digits=" + std::to_string(digits_achieved_));
  if (observer_) {
    observer_->on_end(*record_);
  }
}

void drive_session(PracticeSession& session, KeySource& keys) {
  while (!session.ended()) {
    std::optional<KeyEvent> event;
    try {
      event = keys.poll(poll_timeout(session, SessionClock::now()));
    } catch (const std::runtime_error& ex) {
      log::warning("session", std::string("input failed: ") + ex.what());
      session.handle_interrupt(SessionClock::now());
      break;
    }

    // A key returned by poll was typed before this point, so it is scored
    // even if the deadline passed while poll was returning.
    const auto now = SessionClock::now();
    if (!event.has_value()) {
      session.handle_timeout(now);
    } else if (event->kind == KeyEvent::Kind::Interrupt) {
      session.handle_interrupt(now);
    } else {
      session.handle_key(event->ch, now);
    }
  }
}

PracticeEngine::PracticeEngine(StatsRepository& stats, KeySourceFactory open_keys)
    : stats_(stats), open_keys_(std::move(open_keys)) {}

int PracticeEngine::start_digits_for(const PracticeConfig& config) {
  return compute_start_digits(aggregate(stats_.load()), config);
}

SessionRecord PracticeEngine::run(const PracticeConfig& config, SessionObserver* observer) {
  config.validate();
  PracticeSession session(config, start_digits_for(config), observer);
  {
    auto keys = open_keys_();
    if (!keys) {
      throw TerminalModeError("No key source available");
    }
    session.start(SessionClock::now());
    drive_session(session, *keys);
  }

  const SessionRecord record = session.record();
  try {
    stats_.append(record);
  } catch (const StorageError& ex) {
    log::warning("stats", std::string("session not saved: ") + ex.what());
  }
  return record;
}

} // namespace pigame
