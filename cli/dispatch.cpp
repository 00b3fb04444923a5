#include "options.hpp"
#include "session_view.hpp"

#include "pigame/digit_source.hpp"
#include "pigame/errors.hpp"
#include "pigame/evaluate.hpp"
#include "pigame/render.hpp"

#include <iostream>

namespace pigame::cli {
namespace {

PracticeConfig load_config(ConfigRepository& repo, std::ostream& err) {
  try {
    return repo.load();
  } catch (const InvalidConfig& ex) {
    err << "[config] warning: " << ex.what() << "; using defaults\n";
    return PracticeConfig{};
  }
}

int run_practice(Environment& env, const CliOptions& options, std::ostream& out,
                 std::ostream& err) {
  const auto config = apply_overrides(load_config(env.config, err), options);
  PracticeEngine engine(env.stats, env.open_keys);
  TerminalSessionView view(out);
  engine.run(config, &view);
  return 0;
}

int run_configure(Environment& env, std::istream& in, std::ostream& out, std::ostream& err) {
  const auto current = load_config(env.config, err);
  const auto updated = configure_interactively(in, out, current);
  env.config.save(updated);
  out << "Settings saved.\n";
  return 0;
}

int run_evaluate(const CliOptions& options, std::ostream& out) {
  if (is_easter_egg(*options.guess)) {
    out << easter_egg_text();
    return 0;
  }
  const auto evaluation = evaluate_guess(*options.guess, options.show_digits);
  out << render_evaluation(evaluation, options.verbose, options.colorblind);
  return 0;
}

} // namespace

int run(const std::string& program, const std::vector<std::string>& args, Environment& env,
        std::istream& in, std::ostream& out, std::ostream& err) {
  CliOptions options;
  try {
    options = parse_args(args);
  } catch (const InvalidInput& ex) {
    err << "pigame error: " << ex.what() << "\n" << usage_text(program);
    return 1;
  }

  if (options.help) {
    out << usage_text(program);
    return 0;
  }
  if (options.version) {
    out << version_text(program);
    return 0;
  }

  try {
    if (options.configure) {
      return run_configure(env, in, out, err);
    }
    if (options.stats) {
      out << render_stats(env.stats.load());
      return 0;
    }
    if (options.practice) {
      return run_practice(env, options, out, err);
    }
    if (options.show_digits.has_value() && !options.guess.has_value()) {
      const auto grouped = group_digits(DigitSource::pi_string(*options.show_digits));
      if (options.verbose) {
        out << "π with " << *options.show_digits << " decimals:\t" << grouped << "\n";
      } else {
        out << grouped << "\n";
      }
      return 0;
    }
    if (options.guess.has_value()) {
      return run_evaluate(options, out);
    }
  } catch (const InvalidInput& ex) {
    err << "pigame error: " << ex.what() << "\n" << usage_text(program);
    return 1;
  } catch (const InvalidConfig& ex) {
    err << "pigame error: invalid practice settings: " << ex.what() << "\n";
    return 1;
  } catch (const OutOfRange& ex) {
    err << "pigame error: " << ex.what() << "\n";
    return 1;
  } catch (const TerminalModeError& ex) {
    err << "pigame error: " << ex.what() << "\n";
    return 1;
  } catch (const StorageError& ex) {
    err << "pigame error: " << ex.what() << "\n";
    return 1;
  }

  err << usage_text(program);
  return 1;
}

} // namespace pigame::cli
