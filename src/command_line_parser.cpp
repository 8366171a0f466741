#include "command_line_parser.hpp"

#include <cctype>
#include <sstream>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     std::string summary,
                                     nlohmann::json settings_spec,
                                     std::vector<std::string> positional_keys)
  : process_name_(std::move(process_name)),
    summary_(std::move(summary)),
    settings_spec_(std::move(settings_spec)),
    positional_keys_(std::move(positional_keys)) {
  SettingsManager probe(settings_spec_);
  for(const auto& key : positional_keys_) {
    if(!probe.resolve_key(key)) {
      throw std::runtime_error("positional argument references unknown setting '" + key + "'");
    }
  }
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  std::size_t positional_index = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    auto handle_option = [&](const std::string& key_token, bool long_form){
      auto resolved = settings.resolve_key(key_token);
      if(!resolved) {
        if(long_form) {
          throw CommandLineError("Unknown option --" + key_token);
        }
        return false; // short token that is not an alias: positional
      }
      std::string value;
      if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) &&
           SettingsManager::is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          throw CommandLineError("Missing value for option '" + key_token + "'");
        }
        value = args[++i];
      }
      std::string error;
      if(!settings.set_from_string(*resolved, value, error)) {
        throw CommandLineError("Invalid value for option '" + key_token + "': " + error);
      }
      return true;
    };

    if(token.rfind("--", 0) == 0 && token.size() > 2) {
      handle_option(token.substr(2), true);
      continue;
    }

    if(token.size() > 1 && token[0] == '-' && token[1] != '-') {
      if(handle_option(token.substr(1), false)) {
        continue;
      }
    }

    if(positional_index >= positional_keys_.size()) {
      throw CommandLineError("Unexpected positional argument '" + token + "'");
    }
    const auto& key = positional_keys_[positional_index++];
    std::string error;
    if(!settings.set_from_string(key, token, error)) {
      throw CommandLineError("Invalid value for " + key + " '" + token + "': " + error);
    }
  }
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - {}", process_name_, summary_);
  print_out(nullptr, "Usage:");

  std::string cmd = process_name_;
  for(const auto& key : positional_keys_) {
    cmd += " <" + key + ">";
  }
  print_out(nullptr, "  {} [options]", cmd);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::ostringstream aliases;
    if(entry.contains("aliases")) {
      const auto alias_list = entry.at("aliases").get<std::vector<std::string>>();
      for(std::size_t i = 0; i < alias_list.size(); ++i) {
        aliases << (i == 0 ? " (alias: " : ", ") << "-" << alias_list[i];
      }
      if(!alias_list.empty()) aliases << ")";
    }
    const auto& default_value = entry.at("default");
    std::string default_str = default_value.is_string()
      ? default_value.get<std::string>()
      : default_value.dump();
    print_out(nullptr, "  --{:<20} {:<13} {}{} (default: {})",
              key,
              argument_hint,
              entry.value("description", ""),
              aliases.str(),
              default_str);
  }
  print_out(nullptr, "");
}
