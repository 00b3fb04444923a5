#include "options.hpp"

#include "pigame/digit_source.hpp"
#include "pigame/errors.hpp"

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <sstream>

#ifndef PIGAME_VERSION
#define PIGAME_VERSION "1.6.0"
#endif

namespace pigame::cli {
namespace {

int parse_int(const std::string& text, const std::string& flag) {
  int value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc() || ptr != last) {
    throw InvalidInput("Invalid value for " + flag + " - NOT an integer: '" + text + "'");
  }
  return value;
}

double parse_seconds(const std::string& text, const std::string& flag) {
  char* end = nullptr;
  errno = 0;
  const double value = std::strtod(text.c_str(), &end);
  if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE ||
      !std::isfinite(value)) {
    throw InvalidInput("Invalid value for " + flag + " - NOT a number: '" + text + "'");
  }
  return value;
}

// -p LENGTH: non-positive means the default length.
int parse_show_length(const std::string& text) {
  const int length = parse_int(text, "-p");
  if (length <= 0) {
    return kDefaultDisplayDigits;
  }
  if (length > DigitSource::max_digits()) {
    throw InvalidInput("Invalid input - too big a number for display (max " +
                       std::to_string(DigitSource::max_digits()) + ")");
  }
  return length;
}

class ArgCursor {
public:
  explicit ArgCursor(const std::vector<std::string>& args) : args_(args) {}

  bool done() const { return index_ >= args_.size(); }
  const std::string& next() { return args_[index_++]; }

  // Value for `flag`, either inline (--flag=value) or the following token.
  std::string value_for(const std::string& flag, const std::optional<std::string>& inline_value) {
    if (inline_value.has_value()) {
      return *inline_value;
    }
    if (done()) {
      throw InvalidInput("Option " + flag + " requires a value");
    }
    return next();
  }

private:
  const std::vector<std::string>& args_;
  std::size_t index_ = 0;
};

} // namespace

CliOptions parse_args(const std::vector<std::string>& args) {
  CliOptions options;
  ArgCursor cursor(args);
  bool positional_only = false;

  while (!cursor.done()) {
    const std::string& token = cursor.next();

    if (positional_only || token.empty() || token[0] != '-' || token == "-") {
      if (options.guess.has_value()) {
        throw InvalidInput("Unexpected argument: '" + token + "'");
      }
      options.guess = token;
      continue;
    }
    if (token == "--") {
      positional_only = true;
      continue;
    }

    if (token.rfind("--", 0) == 0) {
      std::string flag = token;
      std::optional<std::string> inline_value;
      const auto eq = token.find('=');
      if (eq != std::string::npos) {
        flag = token.substr(0, eq);
        inline_value = token.substr(eq + 1);
      }

      if (flag == "--help") {
        options.help = true;
      } else if (flag == "--version") {
        options.version = true;
      } else if (flag == "--verbose") {
        options.verbose = true;
      } else if (flag == "--practice") {
        options.practice = true;
      } else if (flag == "--stats") {
        options.stats = true;
      } else if (flag == "--config") {
        options.configure = true;
      } else if (flag == "--visual-aid") {
        options.visual_aid = true;
      } else if (flag == "--no-visual-aid") {
        options.visual_aid = false;
      } else if (flag == "--practice-mode") {
        const auto value = cursor.value_for(flag, inline_value);
        try {
          options.mode = practice_mode_from_string(value);
        } catch (const std::invalid_argument&) {
          throw InvalidInput("Invalid value for --practice-mode: '" + value +
                             "' (standard, timed or chunk)");
        }
      } else if (flag == "--min-digits") {
        options.min_digits = parse_int(cursor.value_for(flag, inline_value), flag);
      } else if (flag == "--max-digits") {
        options.max_digits = parse_int(cursor.value_for(flag, inline_value), flag);
      } else if (flag == "--chunk-size") {
        options.chunk_size = parse_int(cursor.value_for(flag, inline_value), flag);
      } else if (flag == "--time-limit") {
        options.time_limit_seconds = parse_seconds(cursor.value_for(flag, inline_value), flag);
      } else {
        throw InvalidInput("Unknown option: " + token);
      }
      if (inline_value.has_value() &&
          (flag == "--help" || flag == "--version" || flag == "--verbose" ||
           flag == "--practice" || flag == "--stats" || flag == "--config" ||
           flag == "--visual-aid" || flag == "--no-visual-aid")) {
        throw InvalidInput("Option " + flag + " takes no value");
      }
      continue;
    }

    // Short options, clustered as in -vc.
    for (std::size_t i = 1; i < token.size(); ++i) {
      const char c = token[i];
      switch (c) {
        case 'v': options.verbose = true; break;
        case 'V': options.version = true; break;
        case 'c': options.colorblind = true; break;
        case 'h': options.help = true; break;
        case 'p': {
          std::string value;
          if (i + 1 < token.size()) {
            value = token.substr(i + 1);
          } else if (!cursor.done()) {
            value = cursor.next();
          } else {
            throw InvalidInput("Option -p requires a value");
          }
          options.show_digits = parse_show_length(value);
          i = token.size();
          break;
        }
        default:
          throw InvalidInput(std::string("Unknown option: -") + c);
      }
    }
  }
  return options;
}

PracticeConfig apply_overrides(PracticeConfig base, const CliOptions& options) {
  if (options.mode) base.mode = *options.mode;
  if (options.min_digits) base.min_digits = *options.min_digits;
  if (options.max_digits) base.max_digits = *options.max_digits;
  if (options.chunk_size) base.chunk_size = *options.chunk_size;
  if (options.time_limit_seconds) base.time_limit_seconds = *options.time_limit_seconds;
  if (options.visual_aid) base.visual_aid = *options.visual_aid;
  base.validate();
  return base;
}

std::string usage_text(const std::string& program) {
  std::ostringstream oss;
  oss << "Usage:\t" << program << " [-v] [-p LENGTH] [-V] [-c] YOUR_PI\n"
      << "\t" << program << " --practice [practice options]\n"
      << "\t" << program << " --stats | --config\n"
      << "\tEvaluate your version of π (3.141.. )\n"
      << "\t-v          Increase verbosity.\n"
      << "\t-p LENGTH   Calculate and show π with LENGTH number of decimals.\n"
      << "\t-V          Version.\n"
      << "\t-c          Color-blind mode (use underscores instead of color).\n"
      << "\t--practice                 Start an interactive practice session.\n"
      << "\t--practice-mode MODE       standard, timed or chunk.\n"
      << "\t--min-digits N             Lowest starting target.\n"
      << "\t--max-digits N             Digits needed to complete a session.\n"
      << "\t--chunk-size N             Checkpoint interval in chunk mode.\n"
      << "\t--time-limit N             Seconds allowed in timed mode.\n"
      << "\t--visual-aid, --no-visual-aid\n"
      << "\t                           Group digits and show corrections.\n"
      << "\t--stats                    Show practice statistics.\n"
      << "\t--config                   Edit and save the practice settings.\n";
  return oss.str();
}

std::string version_text(const std::string& program) {
  return program + " version: " + PIGAME_VERSION + "\n";
}

} // namespace pigame::cli
