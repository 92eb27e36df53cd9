#include "progress_importer.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include "reader_layout.hpp"
#include "utils.hpp"

ProgressImporter::ProgressImporter(std::shared_ptr<ProgressReconciliationEngine> engine,
                                   std::shared_ptr<Logger> logger)
  : engine_(std::move(engine)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("import")) {
  if(!engine_) {
    throw std::invalid_argument("ProgressImporter: null engine");
  }
}

ProgressImporter::Report ProgressImporter::import_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) {
    throw std::runtime_error("unable to open " + path.string());
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    throw std::runtime_error("invalid legacy progress file " + path.string() + ": " + e.what());
  }
  return import_document(doc);
}

ProgressImporter::Report ProgressImporter::import_document(const nlohmann::json& doc) {
  Report report;
  if(!doc.is_object()) {
    logger_->warn("legacy progress document is not an object");
    return report;
  }
  if(doc.contains("chapters")) import_page_records(doc.at("chapters"), report);
  if(doc.contains("scrollPercentages")) import_scroll_percentages(doc.at("scrollPercentages"), report);
  logger_->info("imported {} page records, {} scroll positions ({} skipped, {} rejected)",
                report.page_records, report.scroll_records, report.skipped, report.rejected);
  return report;
}

void ProgressImporter::import_page_records(const nlohmann::json& chapters, Report& report) {
  if(!chapters.is_array()) {
    logger_->warn("legacy chapters entry is not an array");
    return;
  }
  for(const auto& entry : chapters) {
    try {
      const auto id = entry.at("id").get<int64_t>();
      const int last_page = entry.value("lastPageRead", 0);
      const bool is_read = entry.value("isRead", false);
      if(last_page <= 0 && !is_read) {
        ++report.skipped;
        continue;
      }
      const int pages = std::max(1, entry.value("pageCount", 0));

      ProgressRecord record;
      record.unit_key = std::to_string(id);
      if(entry.contains("mangaId")) record.series_key = std::to_string(entry.at("mangaId").get<int64_t>());
      record.position_fraction = clamp_fraction(layout::percentage_from_page(last_page, pages));
      record.is_complete = is_read;
      record.last_index = std::max(0, last_page);
      submit(record, report.page_records, report);
    } catch(const nlohmann::json::exception& e) {
      ++report.skipped;
      logger_->warn("skipping malformed legacy chapter: {}", e.what());
    }
  }
}

void ProgressImporter::import_scroll_percentages(const nlohmann::json& percentages, Report& report) {
  if(!percentages.is_object()) {
    logger_->warn("legacy scrollPercentages entry is not an object");
    return;
  }
  const std::string prefix = kScrollKeyPrefix;
  for(const auto& [key, value] : percentages.items()) {
    if(key.compare(0, prefix.size(), prefix) != 0 || key.size() == prefix.size() || !value.is_number()) {
      ++report.skipped;
      continue;
    }
    const double fraction = value.get<double>();
    if(!(fraction > 0.0)) {
      ++report.skipped;
      continue;
    }
    ProgressRecord record;
    record.unit_key = key.substr(prefix.size());
    record.position_fraction = clamp_fraction(fraction);
    record.is_complete = fraction >= kReadFractionThreshold;
    record.last_index = 0;
    submit(record, report.scroll_records, report);
  }
}

void ProgressImporter::submit(const ProgressRecord& record, std::size_t& counter, Report& report) {
  auto stamped = record;
  stamped.updated_at = Timestamp{};
  if(engine_->apply_external_update(stamped)) {
    ++counter;
  } else {
    ++report.rejected;
  }
}
