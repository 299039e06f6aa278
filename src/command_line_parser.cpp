#include "command_line_parser.hpp"

#include <cctype>
#include <optional>

#include "log.hpp"

namespace {

// "-5" is a value, "-v" is an option.
bool looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return token.size() > 2;
  return token.size() >= 2 && token[0] == '-' && std::isalpha(static_cast<unsigned char>(token[1]));
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     std::vector<std::string> positional_keys)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    positional_keys_(std::move(positional_keys)) {
  SettingsManager check(settings_spec_);
  for(const auto& key : positional_keys_) {
    if(!check.resolve_key(key)) {
      throw std::invalid_argument("positional argument refers to unknown setting '" + key + "'");
    }
  }
}

void CommandLineParser::apply(SettingsManager& settings, const std::string& key, const std::string& value,
                              const std::string& shown_as) const {
  std::string error;
  if(!settings.set_from_string(key, value, error)) {
    throw CommandLineError("Invalid value for " + shown_as + " '" + value + "': " + error);
  }
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::size_t next_positional = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const auto& token = args[i];
    if(!looks_like_option(token)) {
      if(next_positional >= positional_keys_.size()) {
        throw CommandLineError("Unexpected argument '" + token + "'");
      }
      const auto& key = positional_keys_[next_positional++];
      apply(settings, key, token, key);
      continue;
    }

    const bool long_form = token.rfind("--", 0) == 0;
    std::string name = token.substr(long_form ? 2 : 1);
    std::optional<std::string> inline_value;
    if(long_form) {
      auto eq = name.find('=');
      if(eq != std::string::npos) {
        inline_value = name.substr(eq + 1);
        name.erase(eq);
      }
    }
    const std::string shown_as = (long_form ? "--" : "-") + name;

    auto key = settings.resolve_key(name);
    if(!key) {
      throw CommandLineError("Unknown option " + shown_as);
    }

    if(inline_value) {
      apply(settings, *key, *inline_value, shown_as);
    } else if(settings.is_bool_setting(*key)) {
      // A following true/false/on/off belongs to the flag.
      bool takes_next = i + 1 < args.size() && SettingsManager::parse_bool(args[i + 1]).has_value();
      apply(settings, *key, takes_next ? args[++i] : "true", shown_as);
    } else {
      if(i + 1 >= args.size()) {
        throw CommandLineError("Missing value for " + shown_as);
      }
      apply(settings, *key, args[++i], shown_as);
    }
  }
}

void CommandLineParser::usage() const {
  print_out("{} - find network shares and report whether they are reachable", process_name_);
  std::string cmd = process_name_ + " [options]";
  for(const auto& key : positional_keys_) {
    cmd += " <" + key + ".json>";
  }
  print_out("Usage: {}", cmd);
  print_out("");
  print_out("Options:");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string flags = "--" + key;
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      flags += ", -" + alias;
    }
    if(type != "bool") {
      flags += type == "int" ? " <ms>" : " <value>";
    }

    std::string notes;
    const auto& default_value = entry.at("default");
    if(default_value.is_string() && !default_value.get<std::string>().empty()) {
      notes += " (default: " + default_value.get<std::string>() + ")";
    } else if(default_value.is_number_integer()) {
      notes += " (default: " + default_value.dump() + ")";
    }
    if(!entry.value("persistent", true)) {
      notes += " [not saved]";
    }
    print_out("  {:<36} {}{}", flags, entry.value("description", ""), notes);
  }
  print_out("");
  print_out("Settings are read from .config/sharewatch.json; --save writes the current ones back.");
}
