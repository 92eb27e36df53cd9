#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

#include "log.hpp"

namespace {

std::string argument_hint(const std::string& type) {
  if(type == "bool") return "[true|false]";
  if(type == "duration") return "<ms|Ns>";
  return "<" + type + ">";
}

std::string alias_list(const nlohmann::json& entry) {
  auto aliases = entry.value("aliases", std::vector<std::string>{});
  if(aliases.empty()) return {};
  std::string out = " (alias:";
  for(const auto& alias : aliases) out += " -" + alias;
  return out + ")";
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)) {
  std::vector<std::pair<std::size_t, std::string>> slots;
  for(const auto& entry : argv_spec) {
    slots.emplace_back(entry.at("index").get<std::size_t>(), entry.at("key").get<std::string>());
  }
  std::sort(slots.begin(), slots.end());

  SettingsManager known(settings_spec_);
  for(auto& slot : slots) {
    auto key = known.resolve_key(slot.second);
    if(!key) {
      throw std::invalid_argument("positional argument " + std::to_string(slot.first) +
                                  " maps to unknown setting '" + slot.second + "'");
    }
    positional_keys_.push_back(*key);
  }
}

bool CommandLineParser::looks_like_option(const std::string& token) {
  if(token.size() > 2 && token.compare(0, 2, "--") == 0) return true;
  // "-5" and "-" stay positional
  return token.size() >= 2 && token[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(token[1]));
}

std::optional<std::string> CommandLineParser::apply_option(const Tokens& tokens,
                                                           std::size_t& cursor,
                                                           SettingsManager& settings) const {
  const std::string& token = tokens[cursor];
  const auto start = token.find_first_not_of('-');
  if(start == std::string::npos) return "Unknown option " + token;
  std::string name = token.substr(start);
  std::optional<std::string> value;
  if(auto eq = name.find('='); eq != std::string::npos) {
    value = name.substr(eq + 1);
    name.resize(eq);
  }

  auto key = settings.resolve_key(name);
  if(!key) return "Unknown option " + token;

  if(!value) {
    const bool has_next = cursor + 1 < tokens.size();
    if(settings.is_bool_setting(*key)) {
      value = (has_next && SettingsManager::is_bool_literal(tokens[cursor + 1]))
        ? tokens[++cursor]
        : std::string("true");
    } else if(has_next) {
      value = tokens[++cursor];
    } else {
      return "Missing value for option '" + name + "'";
    }
  }

  std::string error;
  if(!settings.set_from_string(*key, *value, error)) {
    return "Invalid value for option '" + name + "': " + error;
  }
  return std::nullopt;
}

std::optional<std::string> CommandLineParser::apply_positional(const std::string& token,
                                                               std::size_t slot,
                                                               SettingsManager& settings) const {
  if(slot >= positional_keys_.size()) {
    return "Unexpected positional argument '" + token + "'";
  }
  const auto& key = positional_keys_[slot];
  std::string error;
  if(!settings.set_from_string(key, token, error)) {
    return "Invalid value for " + key + " '" + token + "': " + error;
  }
  return std::nullopt;
}

bool CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const {
  Tokens tokens;
  for(int i = 1; argv && i < argc; ++i) tokens.emplace_back(argv[i]);

  std::size_t slot = 0;
  for(std::size_t cursor = 0; cursor < tokens.size(); ++cursor) {
    auto failure = looks_like_option(tokens[cursor])
      ? apply_option(tokens, cursor, settings)
      : apply_positional(tokens[cursor], slot++, settings);
    if(failure) {
      error = *failure;
      return false;
    }
  }
  return true;
}

void CommandLineParser::usage() const {
  std::string synopsis = process_name_ + " [options]";
  for(const auto& key : positional_keys_) synopsis += " [" + key + "]";

  log_to(nullptr, LogChannel::Print, "{} - windowed chapter reader with progress sync", process_name_);
  log_to(nullptr, LogChannel::Print, "Usage: {}", synopsis);
  log_to(nullptr, LogChannel::Print, "");
  log_to(nullptr, LogChannel::Print, "Options:");
  for(const auto& entry : settings_spec_) {
    const auto& fallback = entry.at("default");
    std::string shown = fallback.is_string() ? fallback.get<std::string>() : fallback.dump();
    if(shown.empty()) shown = "\"\"";
    log_to(nullptr, LogChannel::Print, "  --{} {}{}",
           entry.at("key").get<std::string>(),
           argument_hint(entry.at("type").get<std::string>()),
           alias_list(entry));
    log_to(nullptr, LogChannel::Print, "      {} (default: {})", entry.value("description", ""), shown);
  }
}
