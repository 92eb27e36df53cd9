#pragma once
#include <filesystem>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "progress_engine.hpp"

// Moves progress kept by older client versions into the engine. Two legacy
// shapes are understood:
//
//   { "chapters": [ { "id": 12, "mangaId": 3, "pageCount": 20,
//                     "lastPageRead": 7, "isRead": false } ],
//     "scrollPercentages": { "scroll_offset_percentage_12": 0.4 } }
//
// Imported records carry the epoch as their timestamp, so they only fill in
// chapters that have no record yet and never override one.
class ProgressImporter {
public:
  struct Report {
    std::size_t page_records = 0;
    std::size_t scroll_records = 0;
    std::size_t skipped = 0;
    std::size_t rejected = 0;  // chapter open in the reader

    std::size_t imported() const { return page_records + scroll_records; }
  };

  static constexpr const char* kScrollKeyPrefix = "scroll_offset_percentage_";

  ProgressImporter(std::shared_ptr<ProgressReconciliationEngine> engine,
                   std::shared_ptr<Logger> logger = nullptr);

  Report import_document(const nlohmann::json& doc);
  // Throws std::runtime_error when the file cannot be read or parsed.
  Report import_file(const std::filesystem::path& path);

private:
  void import_page_records(const nlohmann::json& chapters, Report& report);
  void import_scroll_percentages(const nlohmann::json& percentages, Report& report);
  void submit(const ProgressRecord& record, std::size_t& counter, Report& report);

  std::shared_ptr<ProgressReconciliationEngine> engine_;
  std::shared_ptr<Logger> logger_;
};
