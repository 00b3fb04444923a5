#pragma once

#include "pigame/config_store.hpp"
#include "pigame/session_engine.hpp"
#include "pigame/stats_store.hpp"
#include "pigame/types.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace pigame::cli {

struct CliOptions {
  bool help = false;
  bool version = false;
  bool verbose = false;
  bool colorblind = false;

  bool practice = false;
  bool stats = false;
  bool configure = false;

  // -p LENGTH
  std::optional<int> show_digits;
  std::optional<std::string> guess;

  // Practice overrides for this run only.
  std::optional<PracticeMode> mode;
  std::optional<int> min_digits;
  std::optional<int> max_digits;
  std::optional<int> chunk_size;
  std::optional<double> time_limit_seconds;
  std::optional<bool> visual_aid;
};

// `args` excludes the program name. Throws InvalidInput.
CliOptions parse_args(const std::vector<std::string>& args);

// Throws InvalidConfig when the result breaks an invariant.
PracticeConfig apply_overrides(PracticeConfig base, const CliOptions& options);

std::string usage_text(const std::string& program);
std::string version_text(const std::string& program);

// Line-oriented prompts for every PracticeConfig field. An empty answer or
// end of input keeps the current value. Throws InvalidConfig when the
// answers do not form a valid config.
PracticeConfig configure_interactively(std::istream& in, std::ostream& out,
                                       const PracticeConfig& current);

struct Environment {
  StatsRepository& stats;
  ConfigRepository& config;
  KeySourceFactory open_keys;
};

// Dispatches one invocation. Returns the process exit code.
int run(const std::string& program, const std::vector<std::string>& args, Environment& env,
        std::istream& in, std::ostream& out, std::ostream& err);

} // namespace pigame::cli
