#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

// key, aliases, type, default, description, persistent, optional min/max.
// Durations are whole milliseconds and also accept "250ms" or "2s" on input.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","window_radius"},          {"aliases", {"radius","wr"}},        {"type","int"},      {"default",1},     {"min",0}, {"max",8},        {"description","Chapters kept loaded on each side of the active chapter"}, {"persistent", true}},
  {{"key","window_debounce_ms"},     {"aliases", {"wdm"}},                {"type","duration"}, {"default",300},   {"min",0}, {"max",10000},    {"description","Delay before a scroll-driven window update is applied"}, {"persistent", true}},
  {{"key","progress_debounce_ms"},   {"aliases", {"pdm"}},                {"type","duration"}, {"default",500},   {"min",0}, {"max",60000},    {"description","Delay before buffered progress is written"}, {"persistent", true}},
  {{"key","scroll_throttle_ms"},     {"aliases", {"stm"}},                {"type","duration"}, {"default",100},   {"min",0}, {"max",5000},     {"description","Delay before a scroll event is evaluated"}, {"persistent", true}},
  {{"key","prefetch_threshold_screens"}, {"aliases", {"pts"}},            {"type","float"},    {"default",2.0},   {"min",0}, {"max",50},       {"description","Screens from either edge that trigger an adjacent chapter fetch"}, {"persistent", true}},
  {{"key","prefetch_timeout_ms"},    {"aliases", {"ptm"}},                {"type","duration"}, {"default",15000}, {"min",100}, {"max",600000}, {"description","Give up on an adjacent chapter fetch after this long"}, {"persistent", true}},
  {{"key","default_page_aspect"},    {"aliases", {"aspect"}},             {"type","float"},    {"default",1.5},   {"min",0.1}, {"max",20},     {"description","Height/width ratio assumed for pages with no cached height"}, {"persistent", true}},
  {{"key","header_height"},          {"aliases", {"hh"}},                 {"type","float"},    {"default",60.0},  {"min",0}, {"max",1000},     {"description","Height of the chapter header above each section"}, {"persistent", true}},
  {{"key","viewport_width"},         {"aliases", {"vw"}},                 {"type","float"},    {"default",390.0}, {"min",1}, {"max",10000},    {"description","Viewport width used by the CLI layout"}, {"persistent", true}},
  {{"key","viewport_height"},        {"aliases", {"vh"}},                 {"type","float"},    {"default",844.0}, {"min",1}, {"max",10000},    {"description","Viewport height used by the CLI layout"}, {"persistent", true}},
  {{"key","store_path"},             {"aliases", {"store"}},              {"type","path"},     {"default",""},    {"description","Progress store file (empty = .config/progress.json)"}, {"persistent", true}},
  {{"key","catalog_path"},           {"aliases", {"catalog"}},            {"type","path"},     {"default",""},    {"description","Chapter catalog JSON used by the CLI"}, {"persistent", true}},
  {{"key","server_url"},             {"aliases", {"server","url"}},       {"type","string"},   {"default","http://127.0.0.1:4567"}, {"description","Content server base URL"}, {"persistent", true}},
  {{"key","remote_sync"},            {"aliases", {"sync"}},               {"type","bool"},     {"default",true},  {"description","Push progress to the content server"}, {"persistent", true}},
  {{"key","log_level"},              {"aliases", {"ll"}},                 {"type","string"},   {"default",""},    {"description","trace|debug|info|warn|error|off (overrides verbose)"}, {"persistent", true}},
  {{"key","log_file"},               {"aliases", {"lf"}},                 {"type","path"},     {"default",""},    {"description","Also write log output to this file"}, {"persistent", true}},
  {{"key","verbose"},                {"aliases", {"v"}},                  {"type","bool"},     {"default",false}, {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                   {"aliases", {"h","?"}},              {"type","bool"},     {"default",false}, {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                   {"aliases", {"persist"}},            {"type","bool"},     {"default",false}, {"description","Persist current settings to disk"}, {"persistent", false}}
});

enum class SettingType { Bool, Int, Float, Duration, String, Path };

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const { return values_.contains(key); }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const { return save_to_file(settings_path()); }
  bool load() { return load_from_file(settings_path()); }
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  std::chrono::milliseconds duration_ms(const std::string& key) const;

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::string description(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { settings_path_ = path; }

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);
  static std::optional<SettingType> type_from_name(const std::string& name);
  // "750", "750ms" or "1.5s"; nullopt when the text is not a duration.
  static std::optional<long long> parse_duration_ms(const std::string& text);

private:
  struct Definition {
    std::string key;
    std::vector<std::string> aliases;
    SettingType type = SettingType::String;
    nlohmann::json fallback;
    std::optional<double> min;
    std::optional<double> max;
    std::string description;
    bool persistent = true;
  };

  static std::vector<Definition> read_definitions(const nlohmann::json& specification);
  const Definition* lookup(const std::string& token) const;
  bool in_range(const Definition& def, double value, std::string& error) const;
  bool assign(const Definition& def, const nlohmann::json& value, std::string& error);
  nlohmann::json coerce(const Definition& def, const std::string& text, std::string& error) const;

  nlohmann::json values_;
  std::vector<Definition> definitions_;
  std::filesystem::path settings_path_;
};

inline std::optional<SettingType> SettingsManager::type_from_name(const std::string& name) {
  if(name == "bool") return SettingType::Bool;
  if(name == "int") return SettingType::Int;
  if(name == "float") return SettingType::Float;
  if(name == "duration") return SettingType::Duration;
  if(name == "string") return SettingType::String;
  if(name == "path") return SettingType::Path;
  return std::nullopt;
}

inline std::vector<SettingsManager::Definition> SettingsManager::read_definitions(const nlohmann::json& specification) {
  std::vector<Definition> defs;
  defs.reserve(specification.size());
  for(const auto& entry : specification) {
    Definition def;
    def.key = entry.at("key").get<std::string>();
    auto type_name = entry.at("type").get<std::string>();
    auto type = type_from_name(type_name);
    if(!type) {
      throw std::invalid_argument("setting '" + def.key + "' has unknown type '" + type_name + "'");
    }
    def.type = *type;
    for(const auto& alias : entry.value("aliases", nlohmann::json::array())) {
      def.aliases.push_back(to_lower(alias.get<std::string>()));
    }
    def.fallback = entry.at("default");
    if(entry.contains("min")) def.min = entry["min"].get<double>();
    if(entry.contains("max")) def.max = entry["max"].get<double>();
    def.description = entry.value("description", "");
    def.persistent = entry.value("persistent", true);
    defs.push_back(std::move(def));
  }
  return defs;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : values_(nlohmann::json::object()),
    definitions_(read_definitions(specification)) {
  for(const auto& def : definitions_) values_[def.key] = def.fallback;
}

inline const SettingsManager::Definition* SettingsManager::lookup(const std::string& token) const {
  const std::string wanted = to_lower(trim_copy(token));
  auto match = std::find_if(definitions_.begin(), definitions_.end(), [&](const Definition& def){
    return to_lower(def.key) == wanted ||
           std::find(def.aliases.begin(), def.aliases.end(), wanted) != def.aliases.end();
  });
  return match == definitions_.end() ? nullptr : &*match;
}

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  for(const auto& def : definitions_) out.push_back(def.key);
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  const auto* def = lookup(key);
  if(!def) return "<unknown>";
  const auto& value = values_.at(def->key);
  switch(def->type) {
    case SettingType::Bool:     return value.get<bool>() ? "true" : "false";
    case SettingType::Duration: return value.dump() + "ms";
    case SettingType::String:
    case SettingType::Path:     return value.get<std::string>();
    default:                    return value.dump();
  }
}

inline std::string SettingsManager::description(const std::string& key) const {
  const auto* def = lookup(key);
  return def ? def->description : std::string();
}

inline std::chrono::milliseconds SettingsManager::duration_ms(const std::string& key) const {
  const auto* def = lookup(key);
  if(!def || def->type != SettingType::Duration) {
    throw std::runtime_error("Not a duration setting: " + key);
  }
  return std::chrono::milliseconds(values_.at(def->key).get<long long>());
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_.empty()) return settings_path_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    log_to(nullptr, LogChannel::PrintErr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    log_to(nullptr, LogChannel::PrintErr, "Ignoring {}: expected a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* def = lookup(item.key());
    if(!def || !def->persistent) continue;
    std::string error;
    if(!assign(*def, item.value(), error)) {
      log_to(nullptr, LogChannel::PrintErr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
  return true;
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& def : definitions_) {
    if(def.persistent) doc[def.key] = values_.at(def.key);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    log_to(nullptr, LogChannel::PrintErr, "Unable to write {}", path.string());
    return false;
  }
  out << doc.dump(2) << '\n';
  return static_cast<bool>(out);
}

inline bool SettingsManager::in_range(const Definition& def, double value, std::string& error) const {
  if(def.min && value < *def.min) {
    error = fmt::format("must be >= {}", *def.min);
    return false;
  }
  if(def.max && value > *def.max) {
    error = fmt::format("must be <= {}", *def.max);
    return false;
  }
  return true;
}

inline bool SettingsManager::assign(const Definition& def,
                                    const nlohmann::json& value,
                                    std::string& error) {
  switch(def.type) {
    case SettingType::Bool:
      if(value.is_boolean()) {
        values_[def.key] = value.get<bool>();
      } else if(value.is_number_integer()) {
        values_[def.key] = value.get<long long>() != 0;
      } else {
        error = "expected boolean";
        return false;
      }
      return true;

    case SettingType::Int:
      if(!value.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      if(!in_range(def, value.get<double>(), error)) return false;
      values_[def.key] = value.get<int>();
      return true;

    case SettingType::Float:
      if(!value.is_number()) {
        error = "expected number";
        return false;
      }
      if(!in_range(def, value.get<double>(), error)) return false;
      values_[def.key] = value.get<double>();
      return true;

    case SettingType::Duration: {
      std::optional<long long> ms;
      if(value.is_number_integer()) {
        ms = value.get<long long>();
      } else if(value.is_string()) {
        ms = parse_duration_ms(value.get<std::string>());
      }
      if(!ms) {
        error = "expected duration (e.g. 300, 300ms, 2s)";
        return false;
      }
      if(!in_range(def, static_cast<double>(*ms), error)) return false;
      values_[def.key] = *ms;
      return true;
    }

    case SettingType::String:
    case SettingType::Path:
      if(!value.is_string()) {
        error = "expected string";
        return false;
      }
      values_[def.key] = def.type == SettingType::Path
        ? std::filesystem::path(value.get<std::string>()).lexically_normal().string()
        : value.get<std::string>();
      return true;
  }
  error = "unsupported type";
  return false;
}

inline nlohmann::json SettingsManager::coerce(const Definition& def,
                                              const std::string& text,
                                              std::string& error) const {
  error.clear();
  const std::string clean = trim_copy(text);
  std::size_t consumed = 0;
  switch(def.type) {
    case SettingType::Bool: {
      const std::string v = to_lower(clean);
      if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
      if(v == "false" || v == "0" || v == "off" || v == "no") return false;
      error = "expected boolean (true|false|on|off)";
      return {};
    }
    case SettingType::Int:
      try {
        int parsed = std::stoi(clean, &consumed);
        if(consumed == clean.size()) return parsed;
      } catch(const std::logic_error&) {
      }
      error = "expected integer";
      return {};
    case SettingType::Float:
      try {
        double parsed = std::stod(clean, &consumed);
        if(consumed == clean.size()) return parsed;
      } catch(const std::logic_error&) {
      }
      error = "expected number";
      return {};
    case SettingType::Duration:
      // the suffix is validated by assign()
      return clean;
    case SettingType::String:
    case SettingType::Path:
      return clean;
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* def = lookup(key);
  if(!def) {
    error = "unknown setting";
    return false;
  }
  auto parsed = coerce(*def, value, error);
  return error.empty() && assign(*def, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  error.clear();
  const auto* def = lookup(key);
  if(!def) {
    error = "unknown setting";
    return false;
  }
  return assign(*def, value, error);
}

inline std::optional<long long> SettingsManager::parse_duration_ms(const std::string& text) {
  std::string clean = to_lower(trim_copy(text));
  double scale = 1.0;
  auto ends_with = [&](const std::string& suffix){
    return clean.size() > suffix.size() &&
           clean.compare(clean.size() - suffix.size(), suffix.size(), suffix) == 0;
  };
  if(ends_with("ms")) {
    clean.resize(clean.size() - 2);
  } else if(ends_with("s")) {
    clean.pop_back();
    scale = 1000.0;
  }
  clean = trim_copy(clean);
  if(clean.empty() || clean[0] == '-') return std::nullopt;
  try {
    std::size_t consumed = 0;
    double amount = std::stod(clean, &consumed);
    if(consumed != clean.size()) return std::nullopt;
    return static_cast<long long>(amount * scale + 0.5);
  } catch(const std::logic_error&) {
    return std::nullopt;
  }
}

inline std::string SettingsManager::to_lower(std::string value) {
  for(auto& ch : value) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  return value;
}

inline bool SettingsManager::is_bool_literal(const std::string& value) {
  static const std::vector<std::string> literals = {"true", "false", "on", "off", "1", "0", "yes", "no"};
  const std::string lowered = to_lower(trim_copy(value));
  return std::find(literals.begin(), literals.end(), lowered) != literals.end();
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  const auto* def = lookup(token);
  if(!def) return std::nullopt;
  return def->key;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* def = lookup(key);
  return def && def->type == SettingType::Bool;
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  auto it = values_.find(key);
  if(it == values_.end()) throw std::runtime_error("Unknown setting: " + key);
  return it->get<T>();
}
