#include "content_types.hpp"

void to_json(nlohmann::json& j, const SubItem& item) {
  j = nlohmann::json{{"index", item.index}, {"url", item.url}};
  if(item.width > 0 && item.height > 0) {
    j["width"] = item.width;
    j["height"] = item.height;
  }
}

void from_json(const nlohmann::json& j, SubItem& item) {
  item.index = j.value("index", 0);
  item.url = j.value("url", std::string());
  item.width = j.value("width", 0);
  item.height = j.value("height", 0);
}

void to_json(nlohmann::json& j, const ContentUnit& unit) {
  j = nlohmann::json{
    {"id", unit.id},
    {"name", unit.display_name},
    {"chapterNumber", unit.chapter_number},
    {"mangaId", unit.series_id},
    {"pageCount", unit.page_count},
    {"isRead", unit.server_is_read},
    {"lastPageRead", unit.server_last_page_read}
  };
}

void from_json(const nlohmann::json& j, ContentUnit& unit) {
  unit.id = j.at("id").get<UnitId>();
  unit.display_name = j.value("name", std::string());
  unit.chapter_number = j.value("chapterNumber", 0.0);
  if(j.contains("mangaId")) {
    const auto& series = j.at("mangaId");
    unit.series_id = series.is_string() ? series.get<std::string>() : series.dump();
  }
  unit.page_count = j.value("pageCount", 0);
  unit.server_is_read = j.value("isRead", false);
  unit.server_last_page_read = j.value("lastPageRead", 0);
}
