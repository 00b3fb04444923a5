#pragma once

#include <stdexcept>
#include <string>

namespace pigame {

// Malformed user input (evaluate guesses, flag values).
class InvalidInput : public std::invalid_argument {
public:
  explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {}
};

class InvalidConfig : public std::invalid_argument {
public:
  explicit InvalidConfig(const std::string& what) : std::invalid_argument(what) {}
};

// Requested digit length is outside the built-in table.
class OutOfRange : public std::out_of_range {
public:
  explicit OutOfRange(const std::string& what) : std::out_of_range(what) {}
};

class StatsCorrupt : public std::runtime_error {
public:
  explicit StatsCorrupt(const std::string& what) : std::runtime_error(what) {}
};

class StorageError : public std::runtime_error {
public:
  explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// Raw input mode could not be entered, e.g. stdin is not a terminal.
class TerminalModeError : public std::runtime_error {
public:
  explicit TerminalModeError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace pigame
