#include "progress_record.hpp"
#include "utils.hpp"

bool operator==(const ProgressRecord& a, const ProgressRecord& b) {
  return a.unit_key == b.unit_key &&
         a.series_key == b.series_key &&
         a.position_fraction == b.position_fraction &&
         a.updated_at == b.updated_at &&
         a.is_complete == b.is_complete &&
         a.last_index == b.last_index;
}

void to_json(nlohmann::json& j, const ProgressRecord& record) {
  j = nlohmann::json{
    {"chapterId", record.unit_key},
    {"seriesId", record.series_key},
    {"lastReadPercentage", record.position_fraction},
    {"updatedAt", to_epoch_ms(record.updated_at)},
    {"isRead", record.is_complete},
    {"lastPageIndex", record.last_index}
  };
}

void from_json(const nlohmann::json& j, ProgressRecord& record) {
  record.unit_key = j.at("chapterId").get<std::string>();
  record.series_key = j.value("seriesId", std::string());
  record.position_fraction = clamp_fraction(j.value("lastReadPercentage", 0.0));
  record.updated_at = from_epoch_ms(j.value("updatedAt", int64_t{0}));
  record.is_complete = j.value("isRead", false);
  record.last_index = j.value("lastPageIndex", 0);
}
