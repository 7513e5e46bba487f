#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"

// Every peerdrop setting. Non-persistent keys are never written by --save and
// are ignored when found in the settings file.
inline const nlohmann::json kSettingsTable = nlohmann::json::array({
  {{"key","verbose"},             {"aliases", {"v"}},              {"type","bool"},   {"default",false},     {"description","Enable verbose debug logging"}},
  {{"key","latency"},             {"aliases", {"l"}},              {"type","int"},    {"default",100},       {"description","Send pacing latency in milliseconds (0 = send immediately)"}},
  {{"key","chunk_size"},          {"aliases", {"cs","chunk"}},     {"type","string"}, {"default","5m"},      {"description","Chunk size for streamed files (e.g. 1k, 1.5m, 3g); sender only"}},
  {{"key","protocol"},            {"aliases", {"mode"}},           {"type","string"}, {"default","stream"},  {"description","Transfer strategy: stream, whole or archive (both sides must match)"}},
  {{"key","connect_retries"},     {"aliases", {"retries"}},        {"type","int"},    {"default",30},        {"description","Connection retries, also seconds to wait for the peer"}},
  {{"key","timeout"},             {"aliases", {"t"}},              {"type","int"},    {"default",300},       {"description","Seconds to wait for any single message"}},
  {{"key","output_dir"},          {"aliases", {"o","out"}},        {"type","string"}, {"default","."},       {"description","Directory received items are written below"}},
  {{"key","progress"},            {"aliases", {"tp"}},             {"type","bool"},   {"default",true},      {"description","Show ASCII progress meter during transfers"}},
  {{"key","progress_meter_size"}, {"aliases", {"meter"}},          {"type","int"},    {"default",40},        {"description","Number of characters used for the progress meter"}},
  {{"key","listen_ip"},           {"aliases", {"li"}},             {"type","string"}, {"default","0.0.0.0"}, {"description","Interface/IP to accept the peer on"}},
  {{"key","listen_port"},         {"aliases", {"lp"}},             {"type","int"},    {"default",7447},      {"description","TCP port to accept the peer on"}},
  {{"key","peer_addr"},           {"aliases", {"peer"}},           {"type","string"}, {"default",""},        {"description","host:port to dial; empty waits for the peer to dial in"}},
  {{"key","paths"},               {"aliases", nlohmann::json::array()}, {"type","list"}, {"default",nlohmann::json::array()}, {"description","Files/directories to send; none selects receiver mode"}, {"persistent", false}},
  {{"key","help"},                {"aliases", {"h","?"}},          {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},        {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

enum class SettingType {
  Bool,
  Int,
  String,
  List
};

// Where the current value of a setting came from.
enum class SettingSource {
  Default,
  File,
  CommandLine
};

struct SettingDefinition {
  std::string key;
  std::vector<std::string> aliases; // lowercase
  SettingType type = SettingType::String;
  nlohmann::json default_value;
  std::string description;
  bool persistent = true;
};

inline std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string trimmed(const std::string& value) {
  auto first = std::find_if(value.begin(), value.end(), [](unsigned char ch){ return !std::isspace(ch); });
  auto last = std::find_if(value.rbegin(), value.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base();
  return first < last ? std::string(first, last) : std::string();
}

inline bool parse_bool_literal(const std::string& text, bool& out) {
  auto v = lowercase(trimmed(text));
  if(v == "true" || v == "1" || v == "on" || v == "yes") { out = true; return true; }
  if(v == "false" || v == "0" || v == "off" || v == "no") { out = false; return true; }
  return false;
}

inline const char* setting_type_name(SettingType type) {
  switch(type) {
    case SettingType::Bool: return "bool";
    case SettingType::Int: return "int";
    case SettingType::String: return "string";
    case SettingType::List: return "list";
  }
  return "?";
}

// Defaults, then the settings file, then argv. Bad values anywhere are
// ConfigurationErrors.
class SettingsManager {
public:
  SettingsManager() : SettingsManager(kSettingsTable) {}
  explicit SettingsManager(const nlohmann::json& table);

  template<typename T>
  T get(const std::string& key) const {
    auto it = values_.find(key);
    if(it == values_.end()) {
      throw ConfigurationError("Unknown setting: " + key);
    }
    return it->second.value.get<T>();
  }

  SettingSource source(const std::string& key) const;
  bool is_overridden(const std::string& key) const { return source(key) != SettingSource::Default; }

  // Accepts a key or any alias, case-insensitively.
  const SettingDefinition* find(const std::string& name) const;
  const std::vector<SettingDefinition>& definitions() const { return definitions_; }

  // `text` as typed on a command line. List settings append.
  void set(const std::string& name, const std::string& text, SettingSource from = SettingSource::CommandLine);
  void set_json(const std::string& name, const nlohmann::json& value, SettingSource from);

  void set_settings_path(const std::filesystem::path& path) { settings_path_ = path; }
  std::filesystem::path settings_path() const;

  // False when there is no settings file; a malformed one throws.
  bool load();
  bool save() const;
  nlohmann::json persistent_json() const;

  bool help_requested() const { return get<bool>("help"); }
  bool save_requested() const { return get<bool>("save"); }

private:
  struct Value {
    nlohmann::json value;
    SettingSource source = SettingSource::Default;
  };

  const SettingDefinition& require(const std::string& name) const;
  void store(const SettingDefinition& def, const nlohmann::json& value, SettingSource from);

  std::vector<SettingDefinition> definitions_;
  std::map<std::string, Value> values_;
  std::filesystem::path settings_path_;
};

inline SettingsManager::SettingsManager(const nlohmann::json& table) {
  for(const auto& row : table) {
    SettingDefinition def;
    def.key = row.at("key").get<std::string>();
    for(const auto& alias : row.value("aliases", nlohmann::json::array())) {
      def.aliases.push_back(lowercase(alias.get<std::string>()));
    }
    auto type = row.at("type").get<std::string>();
    if(type == "bool") def.type = SettingType::Bool;
    else if(type == "int") def.type = SettingType::Int;
    else if(type == "string") def.type = SettingType::String;
    else if(type == "list") def.type = SettingType::List;
    else throw ConfigurationError("Setting '" + def.key + "' has unknown type '" + type + "'");
    def.default_value = row.at("default");
    def.description = row.value("description", "");
    def.persistent = row.value("persistent", true);
    values_[def.key] = Value{def.default_value, SettingSource::Default};
    definitions_.push_back(std::move(def));
  }
}

inline const SettingDefinition* SettingsManager::find(const std::string& name) const {
  auto lowered = lowercase(name);
  for(const auto& def : definitions_) {
    if(lowercase(def.key) == lowered ||
       std::find(def.aliases.begin(), def.aliases.end(), lowered) != def.aliases.end()) {
      return &def;
    }
  }
  return nullptr;
}

inline const SettingDefinition& SettingsManager::require(const std::string& name) const {
  const auto* def = find(name);
  if(!def) {
    throw ConfigurationError("Unknown setting: " + name);
  }
  return *def;
}

inline SettingSource SettingsManager::source(const std::string& key) const {
  auto it = values_.find(require(key).key);
  return it == values_.end() ? SettingSource::Default : it->second.source;
}

inline void SettingsManager::store(const SettingDefinition& def, const nlohmann::json& value, SettingSource from) {
  auto& slot = values_[def.key];
  if(def.type == SettingType::List && value.is_string()) {
    // Appending to the built-in default starts a fresh list.
    if(slot.source == SettingSource::Default) slot.value = nlohmann::json::array();
    slot.value.push_back(value);
  } else {
    slot.value = value;
  }
  slot.source = from;
}

inline void SettingsManager::set(const std::string& name, const std::string& text, SettingSource from) {
  const auto& def = require(name);
  auto invalid = [&](const char* expected){
    return ConfigurationError("Invalid value for " + def.key + " '" + text + "': expected " + expected);
  };
  switch(def.type) {
    case SettingType::Bool: {
      bool flag = false;
      if(!parse_bool_literal(text, flag)) throw invalid("true|false|on|off");
      store(def, flag, from);
      return;
    }
    case SettingType::Int: {
      auto clean = trimmed(text);
      std::size_t consumed = 0;
      int parsed = 0;
      try {
        parsed = std::stoi(clean, &consumed);
      } catch(const std::exception&) {
        throw invalid("integer");
      }
      if(consumed != clean.size()) throw invalid("integer");
      store(def, parsed, from);
      return;
    }
    case SettingType::String:
      store(def, trimmed(text), from);
      return;
    case SettingType::List:
      store(def, text, from);
      return;
  }
}

inline void SettingsManager::set_json(const std::string& name, const nlohmann::json& value, SettingSource from) {
  const auto& def = require(name);
  bool ok = false;
  switch(def.type) {
    case SettingType::Bool: ok = value.is_boolean(); break;
    case SettingType::Int: ok = value.is_number_integer(); break;
    case SettingType::String: ok = value.is_string(); break;
    case SettingType::List:
      ok = value.is_string() ||
           (value.is_array() && std::all_of(value.begin(), value.end(),
                                            [](const nlohmann::json& v){ return v.is_string(); }));
      break;
  }
  if(!ok) {
    throw ConfigurationError("Invalid value for " + def.key + ": expected " + setting_type_name(def.type) +
                             ", got " + value.dump());
  }
  store(def, value, from);
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_.empty()) return settings_path_;
  return std::filesystem::current_path() / ".config" / "peerdrop.json";
}

inline bool SettingsManager::load() {
  auto path = settings_path();
  std::ifstream in(path);
  if(!in) return false;
  auto doc = nlohmann::json::parse(in, nullptr, false);
  if(doc.is_discarded() || !doc.is_object()) {
    throw ConfigurationError("Settings file " + path.string() + " is not a JSON object");
  }
  for(const auto& entry : doc.items()) {
    const auto* def = find(entry.key());
    if(!def || !def->persistent) continue;
    try {
      set_json(def->key, entry.value(), SettingSource::File);
    } catch(const ConfigurationError& e) {
      throw ConfigurationError(std::string(e.what()) + " (in " + path.string() + ")");
    }
  }
  return true;
}

inline nlohmann::json SettingsManager::persistent_json() const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& def : definitions_) {
    if(def.persistent) doc[def.key] = values_.at(def.key).value;
  }
  return doc;
}

inline bool SettingsManager::save() const {
  auto path = settings_path();
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) return false;
  out << persistent_json().dump(2) << "\n";
  return static_cast<bool>(out);
}
