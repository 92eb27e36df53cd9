#pragma once

#include <optional>
#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto SettingsManager. Accepts --key value, --key=value, -alias value,
// bare booleans (--verbose) and positional arguments in argv_spec order.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "scrollkeeper",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","catalog_path"}},
                      {{"index",1},{"key","store_path"}}
                    }));

  // Returns false and fills error on the first bad token.
  bool parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const;
  void usage() const;

private:
  using Tokens = std::vector<std::string>;

  static bool looks_like_option(const std::string& token);
  // Consumes the option at tokens[cursor] and any value after it.
  std::optional<std::string> apply_option(const Tokens& tokens, std::size_t& cursor,
                                          SettingsManager& settings) const;
  std::optional<std::string> apply_positional(const std::string& token, std::size_t slot,
                                              SettingsManager& settings) const;

  std::string process_name_;
  nlohmann::json settings_spec_;
  std::vector<std::string> positional_keys_;
};
