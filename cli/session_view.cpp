#include "session_view.hpp"

#include "pigame/digit_source.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>

namespace pigame::cli {

TerminalSessionView::TerminalSessionView(std::ostream& out) : out_(out) {}

void TerminalSessionView::on_start(const PracticeConfig& config, int start_digits) {
  visual_aid_ = config.visual_aid;
  entered_.clear();
  out_ << "Practice mode: " << to_string(config.mode) << "\n";
  out_ << "Type the digits of π after \"3.\"; Ctrl-C stops the session.\n";
  out_ << "Target: " << start_digits << " digits (session ends at " << config.max_digits << ")\n";
  if (config.mode == PracticeMode::Timed) {
    out_ << "Time limit: " << config.time_limit_seconds << " seconds\n";
  } else if (config.mode == PracticeMode::Chunk) {
    out_ << "Checkpoint every " << config.chunk_size << " digits\n";
  }
  out_ << "3." << std::flush;
}

void TerminalSessionView::on_digit(char digit, int digits_achieved) {
  if (visual_aid_ && digits_achieved > 1 && (digits_achieved - 1) % 5 == 0) {
    out_ << ' ';
  }
  entered_.push_back(digit);
  out_ << digit << std::flush;
}

void TerminalSessionView::on_target_reached(int digits_achieved) {
  out_ << "\n  Target of " << digits_achieved << " digits reached, keep going!\n";
  redraw_progress();
}

void TerminalSessionView::on_checkpoint(int digits_achieved, int chunk_index) {
  out_ << "\n  [chunk " << chunk_index << "] " << digits_achieved << " digits correct\n";
  redraw_progress();
}

void TerminalSessionView::on_mismatch(const Mismatch& mismatch, int position) {
  out_ << "\n  Wrong digit at decimal " << position + 1 << ": you typed " << mismatch.actual;
  if (visual_aid_) {
    out_ << ", expected " << mismatch.expected << "\n";
    out_ << "  π = " << group_digits(DigitSource::pi_string(position + 1));
  }
  out_ << "\n";
}

void TerminalSessionView::on_end(const SessionRecord& record) {
  if (record.end != SessionEnd::Mismatch) {
    out_ << "\n";
  }
  out_ << describe_record(record) << std::flush;
}

void TerminalSessionView::redraw_progress() {
  const std::string progress = "3." + entered_;
  out_ << (visual_aid_ ? group_digits(progress) : progress) << std::flush;
}

std::string describe_record(const SessionRecord& record) {
  std::ostringstream oss;
  switch (record.end) {
    case SessionEnd::Completed:
      oss << "Perfect! You recalled all " << record.digits_achieved << " digits.\n";
      break;
    case SessionEnd::Mismatch:
      oss << "You recalled " << record.digits_achieved << " digits.\n";
      break;
    case SessionEnd::Timeout:
      oss << "Time's up! You recalled " << record.digits_achieved << " digits.\n";
      break;
    case SessionEnd::Interrupted:
      oss << "Session stopped after " << record.digits_achieved << " digits.\n";
      break;
  }
  oss << "Time: " << std::fixed << std::setprecision(1) << record.elapsed_seconds << "s";
  if (record.digits_achieved > record.target_digits && record.target_digits > 0) {
    oss << ", " << record.digits_achieved - record.target_digits << " past your target";
  }
  oss << "\n";
  return oss.str();
}

} // namespace pigame::cli
