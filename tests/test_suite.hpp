#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>

#include <unistd.h>

namespace pigame::testing {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }

  int finish(const std::string& name) const {
    if (!ok) {
      std::cerr << name << " tests FAILED" << std::endl;
      return 1;
    }
    std::cout << name << " tests passed" << std::endl;
    return 0;
  }
};

// Fresh directory under the system temp dir, removed on destruction.
class ScratchDir {
public:
  explicit ScratchDir(const std::string& label) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("pigame-" + label + "-" + std::to_string(::getpid()) + "-" + std::to_string(stamp));
    std::filesystem::create_directories(path_);
  }
  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

inline std::uint64_t advance_rng(std::uint64_t& state) {
  if (state == 0) {
    state = 0x2545F4914F6CDD1DULL;
  }
  std::uint64_t x = state;
  x ^= x << 13;
  x ^= x >> 7;
  x ^= x << 17;
  state = x;
  return x;
}

} // namespace pigame::testing
