#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "share_models.hpp"

// Setting table: key, aliases, type (int|bool|string), default, description,
// whether --save writes it, an optional minimum for ints, and whether the
// value is masked in diagnostics.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","inventory"},             {"aliases", {"i","inv"}},        {"type","string"}, {"default",""},     {"description","JSON network inventory to scan"}, {"persistent", true}},
  {{"key","scan_timeout_ms"},       {"aliases", {"st","timeout"}},   {"type","int"},    {"default",10000},  {"description","Milliseconds before a scan stops on its own"}, {"persistent", true}, {"min", 1}},
  {{"key","connection_timeout_ms"}, {"aliases", {"ct"}},             {"type","int"},    {"default",10000},  {"description","Milliseconds allowed for one connection test"}, {"persistent", true}, {"min", 1}},
  {{"key","manual_host"},           {"aliases", {"host","mh"}},      {"type","string"}, {"default",""},     {"description","Host of a share to add manually"}, {"persistent", false}},
  {{"key","manual_share"},          {"aliases", {"share","ms"}},     {"type","string"}, {"default",""},     {"description","Share name to add manually"}, {"persistent", false}},
  {{"key","username"},              {"aliases", {"user","u"}},       {"type","string"}, {"default",""},     {"description","User name for connection tests (guest when empty)"}, {"persistent", true}},
  {{"key","password"},              {"aliases", {"pass","p"}},       {"type","string"}, {"default",""},     {"description","Password for connection tests"}, {"persistent", false}, {"secret", true}},
  {{"key","json"},                  {"aliases", {"j"}},              {"type","bool"},   {"default",false},  {"description","Print the share report as JSON"}, {"persistent", true}},
  {{"key","verbose"},               {"aliases", {"v"}},              {"type","bool"},   {"default",false},  {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                  {"aliases", {"h","?"}},          {"type","bool"},   {"default",false},  {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                  {"aliases", {"persist"}},        {"type","bool"},   {"default",false},  {"description","Persist current settings to disk"}, {"persistent", false}}
});

// Holds one value per table entry. Setters report problems through `error`
// and leave the previous value in place.
class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const {
    if(!has(key)) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return values_.at(key).template get<T>();
  }

  bool has(const std::string& key) const { return values_.contains(key); }

  std::chrono::milliseconds milliseconds(const std::string& key) const {
    return std::chrono::milliseconds(get<int>(key));
  }
  // Guest access (nullopt) when no user name is configured.
  std::optional<ShareCredentials> credentials() const;

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // Missing file: false, defaults stay. Unreadable entries are reported and skipped.
  bool load();
  bool save() const;
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { path_override_ = path; }

  std::vector<std::string> keys() const;
  // Secret values come back masked.
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  nlohmann::json get_json(bool persistent_only = true) const;

  static std::optional<bool> parse_bool(const std::string& value);

private:
  enum class Type { Bool, Int, String };

  struct Entry {
    std::string key;
    std::vector<std::string> aliases; // lower case
    Type type = Type::String;
    nlohmann::json default_value;
    bool persistent = true;
    bool secret = false;
    std::optional<int> min;
  };

  const Entry* find_entry(const std::string& token) const;
  bool store(const Entry& entry, const nlohmann::json& value, std::string& error);

  std::vector<Entry> entries_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path path_override_;
};
