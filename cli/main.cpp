#include "options.hpp"

#include "pigame/config_store.hpp"
#include "pigame/stats_store.hpp"
#include "pigame/terminal.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

int main(int argc, char* argv[]) {
  const std::string program =
      argc > 0 ? std::filesystem::path(argv[0]).filename().string() : std::string("pigame");
  std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  pigame::JsonStatsRepository stats(pigame::default_stats_path());
  pigame::JsonConfigRepository config(pigame::default_config_path());
  pigame::cli::Environment env{
      stats, config,
      []() -> std::unique_ptr<pigame::KeySource> {
        return std::make_unique<pigame::TerminalKeySource>(STDIN_FILENO);
      }};

  return pigame::cli::run(program, args, env, std::cin, std::cout, std::cerr);
}
