#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto SettingsManager keys. Positional arguments fill the keys
// named in argv_spec in order; "--key value" / "-alias value" set any key.
// Throws UserInputError on anything it cannot place.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "p2pdrop",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","command"}},
                      {{"index",1},{"key","file"}}
                    }));

  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;
  void usage() const;

private:
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  nlohmann::json settings_spec_;
  std::vector<std::string> positional_keys_;
};
