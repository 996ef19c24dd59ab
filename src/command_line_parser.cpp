#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

#include "errors.hpp"
#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)) {
  std::vector<std::pair<std::size_t, std::string>> ordered;
  for(const auto& entry : argv_spec) {
    ordered.emplace_back(entry.at("index").get<std::size_t>(), entry.at("key").get<std::string>());
  }
  std::sort(ordered.begin(), ordered.end());

  SettingsManager probe(settings_spec_);
  for(auto& item : ordered) {
    if(!probe.resolve_key(item.second)) {
      throw std::runtime_error("ARGV specification references unknown setting '" + item.second + "'");
    }
    positional_keys_.push_back(std::move(item.second));
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

    // Returns false when a short token is not a known alias, so it can be
    // taken as a positional argument instead.
    auto handle_option = [&](const std::string& key_token, bool long_form) {
      auto resolved = settings.resolve_key(key_token);
      if(!resolved) {
        if(long_form) throw UserInputError("Unknown option --" + key_token);
        return false;
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
          throw UserInputError("Missing value for option '" + key_token + "'");
        }
        value = args[++i];
      }
      std::string error;
      if(!settings.set_from_string(*resolved, value, error)) {
        throw UserInputError("Invalid value for option '" + key_token + "': " + error);
      }
      return true;
    };

    if(token.rfind("--", 0) == 0) {
      handle_option(token.substr(2), true);
      continue;
    }
    if(token.size() > 1 && token[0] == '-' && handle_option(token.substr(1), false)) {
      continue;
    }

    if(positional_index >= positional_keys_.size()) {
      throw UserInputError("Unexpected positional argument '" + token + "'");
    }
    const auto& key = positional_keys_[positional_index++];
    std::string error;
    if(!settings.set_from_string(key, token, error)) {
      throw UserInputError("Invalid value for " + key + " '" + token + "': " + error);
    }
  }
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - share one file with peers on the local network", process_name_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {} send <file> [options]   announce and serve <file>", process_name_);
  print_out(nullptr, "  {} recv [options]          pick an announced file and download it", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  SettingsManager defaults(settings_spec_);
  for(const auto& spec : defaults.specs()) {
    if(std::find(positional_keys_.begin(), positional_keys_.end(), spec.key) != positional_keys_.end()) {
      continue;
    }
    std::string argument_hint = (spec.type == "bool") ? "[true|false]" : "<" + spec.type + ">";
    std::ostringstream aliases;
    if(!spec.aliases.empty()) {
      aliases << " (alias: ";
      for(std::size_t i = 0; i < spec.aliases.size(); ++i) {
        if(i > 0) aliases << ", ";
        aliases << "-" << spec.aliases[i];
      }
      aliases << ")";
    }
    print_out(nullptr, "  --{} {:<12} {}{} (default: {})",
              spec.key,
              argument_hint,
              spec.description,
              aliases.str(),
              defaults.value_as_string(spec.key));
  }
  print_out(nullptr, "");
}
