#include "settings_manager.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include "log.hpp"
#include "utils.hpp"

SettingsManager::SettingsManager() : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const nlohmann::json& specification) {
  for(const auto& item : specification) {
    Entry entry;
    entry.key = item.at("key").get<std::string>();
    for(const auto& alias : item.value("aliases", std::vector<std::string>{})) {
      entry.aliases.push_back(to_lower_copy(alias));
    }
    auto type = item.at("type").get<std::string>();
    if(type == "bool") {
      entry.type = Type::Bool;
    } else if(type == "int") {
      entry.type = Type::Int;
    } else if(type == "string") {
      entry.type = Type::String;
    } else {
      throw std::invalid_argument("setting '" + entry.key + "' has unknown type '" + type + "'");
    }
    entry.default_value = item.at("default");
    entry.persistent = item.value("persistent", true);
    entry.secret = item.value("secret", false);
    if(item.contains("min")) {
      entry.min = item.at("min").get<int>();
    }
    values_[entry.key] = entry.default_value;
    entries_.push_back(std::move(entry));
  }
}

const SettingsManager::Entry* SettingsManager::find_entry(const std::string& token) const {
  auto lowered = to_lower_copy(token);
  for(const auto& entry : entries_) {
    if(to_lower_copy(entry.key) == lowered ||
       std::find(entry.aliases.begin(), entry.aliases.end(), lowered) != entry.aliases.end()) {
      return &entry;
    }
  }
  return nullptr;
}

std::optional<bool> SettingsManager::parse_bool(const std::string& value) {
  auto v = to_lower_copy(trim_copy(value));
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}

bool SettingsManager::store(const Entry& entry, const nlohmann::json& value, std::string& error) {
  error.clear();
  switch(entry.type) {
    case Type::Bool:
      if(value.is_boolean()) {
        values_[entry.key] = value.get<bool>();
      } else if(value.is_number_integer()) {
        values_[entry.key] = value.get<int>() != 0;
      } else {
        error = "expected boolean";
        return false;
      }
      return true;
    case Type::Int: {
      if(!value.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      auto number = value.get<int>();
      if(entry.min && number < *entry.min) {
        error = "must be at least " + std::to_string(*entry.min);
        return false;
      }
      values_[entry.key] = number;
      return true;
    }
    case Type::String:
      if(!value.is_string()) {
        error = "expected string";
        return false;
      }
      values_[entry.key] = value.get<std::string>();
      return true;
  }
  error = "unknown type";
  return false;
}

bool SettingsManager::set_from_string(const std::string& key, const std::string& value, std::string& error) {
  const auto* entry = find_entry(key);
  if(!entry) {
    error = "unknown setting";
    return false;
  }
  auto clean = trim_copy(value);
  switch(entry->type) {
    case Type::Bool: {
      auto parsed = parse_bool(clean);
      if(!parsed) {
        error = "expected boolean (true|false|on|off)";
        return false;
      }
      return store(*entry, *parsed, error);
    }
    case Type::Int:
      try {
        std::size_t used = 0;
        int number = std::stoi(clean, &used);
        if(used != clean.size()) {
          error = "expected integer";
          return false;
        }
        return store(*entry, number, error);
      } catch(const std::exception&) {
        error = "expected integer";
        return false;
      }
    case Type::String:
      return store(*entry, clean, error);
  }
  error = "unknown type";
  return false;
}

bool SettingsManager::set_from_json(const std::string& key, const nlohmann::json& value, std::string& error) {
  const auto* entry = find_entry(key);
  if(!entry) {
    error = "unknown setting";
    return false;
  }
  return store(*entry, value, error);
}

std::optional<ShareCredentials> SettingsManager::credentials() const {
  auto username = get<std::string>("username");
  if(username.empty()) return std::nullopt;
  return ShareCredentials{username, get<std::string>("password")};
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!path_override_.empty()) return path_override_;
  return std::filesystem::current_path() / ".config" / "sharewatch.json";
}

bool SettingsManager::load() {
  return load_from_file(settings_path());
}

bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err("Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err("Ignoring {}: expected a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* entry = find_entry(item.key());
    if(!entry || !entry->persistent) continue;
    std::string error;
    if(!store(*entry, item.value(), error)) {
      print_err("Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
  return true;
}

bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  if(path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err("Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2) << '\n';
  return static_cast<bool>(out);
}

std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for(const auto& entry : entries_) out.push_back(entry.key);
  return out;
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  const auto* entry = find_entry(key);
  if(!entry) return "<unknown>";
  const auto& value = values_.at(entry->key);
  if(value.is_string()) {
    const auto& text = value.get_ref<const std::string&>();
    return entry->secret && !text.empty() ? "********" : text;
  }
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* entry = find_entry(token)) return entry->key;
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* entry = find_entry(key);
  return entry && entry->type == Type::Bool;
}

nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& entry : entries_) {
    if(persistent_only && !entry.persistent) continue;
    doc[entry.key] = values_.at(entry.key);
  }
  return doc;
}
