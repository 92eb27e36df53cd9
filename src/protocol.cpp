#include "protocol.hpp"
#include <stdexcept>

namespace {

json chapter_id_value(const std::string& unit_key) {
  // the server keys chapters by integer id; keep non-numeric keys as strings
  try {
    std::size_t consumed = 0;
    long long id = std::stoll(unit_key, &consumed);
    if(consumed == unit_key.size()) return id;
  } catch(const std::exception&) {
    // not numeric
  }
  return unit_key;
}

} // namespace

json make_progress_mutation(const std::string& unit_key,
                            int last_page_read,
                            bool is_read){
  json j;
  j["operationName"] = kUpdateChapterProgressOperation;
  j["variables"] = {
    {"chapterId", chapter_id_value(unit_key)},
    {"lastPageRead", last_page_read},
    {"isRead", is_read}
  };
  return j;
}
