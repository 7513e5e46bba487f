#include "command_line_parser.hpp"

#include <cctype>
#include <vector>

#include "errors.hpp"
#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name, std::string positional_key)
  : process_name_(std::move(process_name)),
    positional_key_(std::move(positional_key)) {}

bool CommandLineParser::looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return token.size() > 2;
  return token.size() >= 2 && token[0] == '-' &&
         (std::isalpha(static_cast<unsigned char>(token[1])) || token[1] == '?');
}

CommandLineParser::OptionToken CommandLineParser::read_option(const std::string& token,
                                                              const SettingsManager& settings) const {
  OptionToken option;
  bool long_form = token.rfind("--", 0) == 0;
  std::string name = token.substr(long_form ? 2 : 1);
  auto eq = name.find('=');
  if(long_form && eq != std::string::npos) {
    option.attached = name.substr(eq + 1);
    name = name.substr(0, eq);
  }
  option.spelled = token.substr(0, long_form ? 2 : 1) + name;
  option.definition = settings.find(name);
  if(!option.definition || option.definition->key == positional_key_) {
    throw ConfigurationError("Unknown option " + option.spelled);
  }
  return option;
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  for(int i = 1; i < argc && argv && argv[i]; ++i) {
    args.emplace_back(argv[i]);
  }

  bool options_done = false;
  for(std::size_t i = 0; i < args.size(); ++i) {
    const auto& token = args[i];
    if(options_done || !looks_like_option(token)) {
      if(!options_done && token == "--") {
        options_done = true;
        continue;
      }
      settings.set(positional_key_, token);
      continue;
    }

    auto option = read_option(token, settings);
    std::string value;
    if(option.attached) {
      value = *option.attached;
    } else if(option.definition->type == SettingType::Bool) {
      // "-v" alone means true; "-v off" consumes the literal.
      bool ignored = false;
      if(i + 1 < args.size() && parse_bool_literal(args[i + 1], ignored)) {
        value = args[++i];
      } else {
        value = "true";
      }
    } else if(i + 1 < args.size()) {
      value = args[++i];
    } else {
      throw ConfigurationError("Missing value for option " + option.spelled);
    }
    settings.set(option.definition->key, value);
  }
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  console_print("{} - send files and directories to a peer sharing the same token", process_name_);
  console_print("Usage:");
  console_print("  {} [options] [{}...]", process_name_, positional_key_);
  console_print("  With no {} the process receives; the token comes from PEERDROP_TOKEN.", positional_key_);
  console_print("");
  console_print("Options:");
  for(const auto& def : settings.definitions()) {
    if(def.key == positional_key_) continue;
    std::string hint = def.type == SettingType::Bool
      ? "[true|false]"
      : std::string("<") + setting_type_name(def.type) + ">";
    std::string aliases;
    for(const auto& alias : def.aliases) {
      aliases += aliases.empty() ? " (alias: -" : ", -";
      aliases += alias;
    }
    if(!aliases.empty()) aliases += ")";
    std::string fallback = def.default_value.is_string()
      ? def.default_value.get<std::string>()
      : def.default_value.dump();
    console_print("  --{:<20} {:<12} {}{} (default: {})", def.key, hint, def.description, aliases, fallback);
  }
  console_print("");
}
