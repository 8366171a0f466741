#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "settings_manager.hpp"

class CommandLineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Positional arguments fill settings in order; every setting is also
// reachable as --key value or -alias value. Bool options may omit the value.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name,
                    std::string summary,
                    nlohmann::json settings_spec,
                    std::vector<std::string> positional_keys);

  // Throws CommandLineError on unknown options, bad values or surplus
  // positionals.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;
  void usage() const;

private:
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  std::string summary_;
  nlohmann::json settings_spec_;
  std::vector<std::string> positional_keys_;
};
