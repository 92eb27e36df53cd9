#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "content_types.hpp"

struct FetchResult {
  enum class Status {
    Found,     // unit and items are valid
    Boundary,  // no adjacent unit exists; terminal
    Failed     // transient failure; the same request may be retried
  };
  Status status = Status::Failed;
  ContentUnit unit;
  std::vector<SubItem> items;
  std::string error;

  static FetchResult found(ContentUnit unit, std::vector<SubItem> items) {
    FetchResult r;
    r.status = Status::Found;
    r.unit = std::move(unit);
    r.items = std::move(items);
    return r;
  }
  static FetchResult boundary() {
    FetchResult r;
    r.status = Status::Boundary;
    return r;
  }
  static FetchResult failed(std::string why) {
    FetchResult r;
    r.status = Status::Failed;
    r.error = std::move(why);
    return r;
  }
};

const char* to_string(FetchResult::Status status);

// Supplies chapters and their pages. Calls may block; they are made from
// worker threads, never from the io thread.
class ContentSource {
public:
  virtual ~ContentSource() = default;

  // Adjacent chapter after (Forward) or before (Backward) the given one,
  // together with its pages.
  virtual FetchResult fetch_adjacent(UnitId from, Direction direction) = 0;

  // Pages of a chapter known to exist. Throws std::runtime_error on failure.
  virtual std::vector<SubItem> fetch_items(UnitId id) = 0;
};

// Ordered chapter list held in memory. Chapters are kept the way the server
// lists them, newest first, so reading forward walks toward lower positions.
class CatalogContentSource : public ContentSource {
public:
  struct Entry {
    ContentUnit unit;
    std::vector<SubItem> items;
  };

  CatalogContentSource() = default;
  explicit CatalogContentSource(std::vector<Entry> newest_first);

  // { "chapters": [ { "id":..., "name":..., "pages":[{"index":0,"url":...}] } ] }
  static std::shared_ptr<CatalogContentSource> load_from_file(const std::filesystem::path& path);
  static std::shared_ptr<CatalogContentSource> from_json(const nlohmann::json& doc);

  FetchResult fetch_adjacent(UnitId from, Direction direction) override;
  std::vector<SubItem> fetch_items(UnitId id) override;

  std::vector<ContentUnit> units() const;
  std::optional<ContentUnit> unit(UnitId id) const;

  // Make the next n fetches fail with a transient error.
  void inject_failures(int n);

private:
  std::optional<std::size_t> position_of(UnitId id) const;

  mutable std::mutex m_;
  std::vector<Entry> entries_;
  int pending_failures_ = 0;
};
