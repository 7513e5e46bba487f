#pragma once

#include <optional>
#include <string>

#include "settings_manager.hpp"

// Maps argv onto settings: "--key value", "--key=value", "-alias value", bare
// boolean flags, and positional arguments, which all land in one list
// setting. "--" ends option parsing.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "peerdrop",
                             std::string positional_key = "paths");

  // Throws ConfigurationError on unknown options or invalid values.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage(const SettingsManager& settings) const;

private:
  struct OptionToken {
    const SettingDefinition* definition = nullptr;
    std::string spelled;                 // as typed, for messages
    std::optional<std::string> attached; // value after '='
  };

  static bool looks_like_option(const std::string& token);
  OptionToken read_option(const std::string& token, const SettingsManager& settings) const;

  std::string process_name_;
  std::string positional_key_;
};
