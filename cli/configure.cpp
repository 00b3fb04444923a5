#include "options.hpp"

#include "pigame/errors.hpp"

#include <functional>
#include <iostream>
#include <sstream>
#include <string>

namespace pigame::cli {
namespace {

std::string trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r");
  return text.substr(first, last - first + 1);
}

// Re-asks until `accept` takes the answer. Empty input or end of input
// keeps the current value.
void ask(std::istream& in, std::ostream& out, const std::string& label, const std::string& current,
         const std::function<bool(const std::string&)>& accept) {
  while (true) {
    out << label << " [" << current << "]: " << std::flush;
    std::string line;
    if (!std::getline(in, line)) {
      out << "\n";
      return;
    }
    const auto answer = trim(line);
    if (answer.empty() || accept(answer)) {
      return;
    }
    out << "  Invalid value: " << answer << "\n";
  }
}

bool parse_positive_int(const std::string& text, int& value) {
  std::istringstream iss(text);
  int parsed = 0;
  if (!(iss >> parsed) || !iss.eof() || parsed <= 0) {
    return false;
  }
  value = parsed;
  return true;
}

std::string format_seconds(double seconds) {
  std::ostringstream oss;
  oss << seconds;
  return oss.str();
}

} // namespace

PracticeConfig configure_interactively(std::istream& in, std::ostream& out,
                                       const PracticeConfig& current) {
  PracticeConfig next = current;
  out << "Practice settings (press Enter to keep the current value)\n";

  ask(in, out, "Mode (standard, timed, chunk)", to_string(next.mode), [&](const std::string& a) {
    try {
      next.mode = practice_mode_from_string(a);
      return true;
    } catch (const std::invalid_argument&) {
      return false;
    }
  });
  ask(in, out, "Minimum digits", std::to_string(next.min_digits),
      [&](const std::string& a) { return parse_positive_int(a, next.min_digits); });
  ask(in, out, "Maximum digits", std::to_string(next.max_digits),
      [&](const std::string& a) { return parse_positive_int(a, next.max_digits); });
  ask(in, out, "Chunk size", std::to_string(next.chunk_size),
      [&](const std::string& a) { return parse_positive_int(a, next.chunk_size); });
  ask(in, out, "Time limit in seconds", format_seconds(next.time_limit_seconds),
      [&](const std::string& a) {
        std::istringstream iss(a);
        double seconds = 0.0;
        if (!(iss >> seconds) || !iss.eof() || seconds <= 0.0) {
          return false;
        }
        next.time_limit_seconds = seconds;
        return true;
      });
  ask(in, out, "Visual aid (yes/no)", next.visual_aid ? "yes" : "no", [&](const std::string& a) {
    if (a == "y" || a == "yes" || a == "on" || a == "true") {
      next.visual_aid = true;
      return true;
    }
    if (a == "n" || a == "no" || a == "off" || a == "false") {
      next.visual_aid = false;
      return true;
    }
    return false;
  });

  next.validate();
  return next;
}

} // namespace pigame::cli
