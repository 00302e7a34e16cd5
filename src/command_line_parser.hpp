#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "settings_manager.hpp"

// Applies `--key value`, `--key=value` and `-alias value` options to a
// SettingsManager; every other token is a file to upload. A bool option
// given bare means true. `--` ends option parsing.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "chunkup");

  // Throws std::invalid_argument on an unknown option or a bad value.
  std::vector<std::string> parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage(const SettingsManager& settings) const;

private:
  // Consumes the option at args[i] (and its value) and returns false when the
  // token is not a known option.
  bool apply_option(const std::vector<std::string>& args,
                    std::size_t& i,
                    SettingsManager& settings) const;

  std::string process_name_;
};
