#pragma once
#include <map>
#include <vector>
#include "content_types.hpp"

// One chapter inside the reading window. Heights are layout data and stay
// cached while the page payloads come and go with load_state.
struct WindowSection {
  ContentUnit unit;
  std::vector<SubItem> items;
  std::map<int, float> sub_item_heights;
  LoadState load_state = LoadState::NotLoaded;
};

enum class SectionEvent { Inserted, Loaded, Unloaded };

inline const char* to_string(SectionEvent event) {
  switch(event) {
    case SectionEvent::Inserted: return "inserted";
    case SectionEvent::Loaded:   return "loaded";
    case SectionEvent::Unloaded: return "unloaded";
  }
  return "?";
}
