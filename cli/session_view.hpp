#pragma once

#include "pigame/session_engine.hpp"

#include <iosfwd>
#include <string>

namespace pigame::cli {

// Prints session progress to a terminal in raw mode.
class TerminalSessionView : public SessionObserver {
public:
  explicit TerminalSessionView(std::ostream& out);

  void on_start(const PracticeConfig& config, int start_digits) override;
  void on_digit(char digit, int digits_achieved) override;
  void on_target_reached(int digits_achieved) override;
  void on_checkpoint(int digits_achieved, int chunk_index) override;
  void on_mismatch(const Mismatch& mismatch, int position) override;
  void on_end(const SessionRecord& record) override;

private:
  void redraw_progress();

  std::ostream& out_;
  bool visual_aid_ = true;
  std::string entered_;
};

std::string describe_record(const SessionRecord& record);

} // namespace pigame::cli
