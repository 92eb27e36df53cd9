#include "content_source.hpp"

#include <fstream>
#include <stdexcept>

const char* to_string(FetchResult::Status status) {
  switch(status) {
    case FetchResult::Status::Found:    return "found";
    case FetchResult::Status::Boundary: return "boundary";
    case FetchResult::Status::Failed:   return "failed";
  }
  return "?";
}

CatalogContentSource::CatalogContentSource(std::vector<Entry> newest_first)
  : entries_(std::move(newest_first)) {}

std::shared_ptr<CatalogContentSource> CatalogContentSource::load_from_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) {
    throw std::runtime_error("Unable to open catalog " + path.string());
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    throw std::runtime_error("Invalid catalog " + path.string() + ": " + e.what());
  }
  return from_json(doc);
}

std::shared_ptr<CatalogContentSource> CatalogContentSource::from_json(const nlohmann::json& doc) {
  const auto& chapters = doc.contains("chapters") ? doc.at("chapters") : doc;
  if(!chapters.is_array()) {
    throw std::runtime_error("catalog must contain a chapters array");
  }
  std::vector<Entry> entries;
  entries.reserve(chapters.size());
  for(const auto& chapter : chapters) {
    Entry entry;
    entry.unit = chapter.get<ContentUnit>();
    if(chapter.contains("pages")) {
      entry.items = chapter.at("pages").get<std::vector<SubItem>>();
    }
    if(entry.unit.page_count == 0) {
      entry.unit.page_count = static_cast<int>(entry.items.size());
    }
    entries.push_back(std::move(entry));
  }
  return std::make_shared<CatalogContentSource>(std::move(entries));
}

std::optional<std::size_t> CatalogContentSource::position_of(UnitId id) const {
  for(std::size_t i = 0; i < entries_.size(); ++i) {
    if(entries_[i].unit.id == id) return i;
  }
  return std::nullopt;
}

FetchResult CatalogContentSource::fetch_adjacent(UnitId from, Direction direction) {
  std::lock_guard lg(m_);
  if(pending_failures_ > 0) {
    --pending_failures_;
    return FetchResult::failed("injected failure");
  }
  auto pos = position_of(from);
  if(!pos) {
    return FetchResult::failed("unknown chapter " + std::to_string(from));
  }
  // newest first: forward reading moves toward index 0
  if(direction == Direction::Forward) {
    if(*pos == 0) return FetchResult::boundary();
    const auto& e = entries_[*pos - 1];
    return FetchResult::found(e.unit, e.items);
  }
  if(*pos + 1 >= entries_.size()) return FetchResult::boundary();
  const auto& e = entries_[*pos + 1];
  return FetchResult::found(e.unit, e.items);
}

std::vector<SubItem> CatalogContentSource::fetch_items(UnitId id) {
  std::lock_guard lg(m_);
  if(pending_failures_ > 0) {
    --pending_failures_;
    throw std::runtime_error("injected failure");
  }
  auto pos = position_of(id);
  if(!pos) {
    throw std::runtime_error("unknown chapter " + std::to_string(id));
  }
  return entries_[*pos].items;
}

std::vector<ContentUnit> CatalogContentSource::units() const {
  std::lock_guard lg(m_);
  std::vector<ContentUnit> out;
  out.reserve(entries_.size());
  for(const auto& e : entries_) out.push_back(e.unit);
  return out;
}

std::optional<ContentUnit> CatalogContentSource::unit(UnitId id) const {
  std::lock_guard lg(m_);
  auto pos = position_of(id);
  if(!pos) return std::nullopt;
  return entries_[*pos].unit;
}

void CatalogContentSource::inject_failures(int n) {
  std::lock_guard lg(m_);
  pending_failures_ = n;
}
