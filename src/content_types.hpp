#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using UnitId = int64_t;

// One page of a chapter.
struct SubItem {
  int index = 0;
  std::string url;   // server-relative or absolute
  int width = 0;     // 0 when the server did not report a size
  int height = 0;
};

// One chapter as reported by the server. Immutable once fetched.
struct ContentUnit {
  UnitId id = 0;
  std::string display_name;
  double chapter_number = 0.0;
  std::string series_id;
  int page_count = 0;
  bool server_is_read = false;
  int server_last_page_read = 0;

  std::string key() const { return std::to_string(id); }
};

enum class Direction { Forward, Backward };

enum class LoadState { NotLoaded, Loading, Loaded, Unloaded };

inline const char* to_string(LoadState state) {
  switch(state) {
    case LoadState::NotLoaded: return "not-loaded";
    case LoadState::Loading:   return "loading";
    case LoadState::Loaded:    return "loaded";
    case LoadState::Unloaded:  return "unloaded";
  }
  return "?";
}

inline const char* to_string(Direction direction) {
  return direction == Direction::Forward ? "forward" : "backward";
}

void to_json(nlohmann::json& j, const SubItem& item);
void from_json(const nlohmann::json& j, SubItem& item);
void to_json(nlohmann::json& j, const ContentUnit& unit);
void from_json(const nlohmann::json& j, ContentUnit& unit);
