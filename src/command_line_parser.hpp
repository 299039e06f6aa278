#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "settings_manager.hpp"

class CommandLineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Maps argv onto settings: `--key value`, `--key=value`, `-alias value`, bare
// boolean flags, and positional arguments in the order given.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "sharewatch",
                             nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                             std::vector<std::string> positional_keys = {"inventory"});

  // Throws CommandLineError on unknown options, missing or bad values, and
  // surplus positional arguments. Settings parsed before the error are kept.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage() const;

private:
  void apply(SettingsManager& settings, const std::string& key, const std::string& value,
             const std::string& shown_as) const;

  std::string process_name_;
  nlohmann::json settings_spec_;
  std::vector<std::string> positional_keys_;
};
