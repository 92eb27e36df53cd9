#include "read_status.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/fmt/fmt.h>

#include "reader_layout.hpp"

namespace read_status {

bool is_read(const ContentUnit& unit, const LocalFlags& local) {
  auto it = local.find(unit.key());
  return it != local.end() ? it->second : unit.server_is_read;
}

std::vector<bool> merge_read_status(const std::vector<ContentUnit>& units, const LocalFlags& local) {
  std::vector<bool> out;
  out.reserve(units.size());
  for(const auto& u : units) out.push_back(is_read(u, local));
  return out;
}

std::size_t unread_count(const std::vector<ContentUnit>& units, const LocalFlags& local) {
  return static_cast<std::size_t>(std::count_if(units.begin(), units.end(),
    [&](const ContentUnit& u){ return !is_read(u, local); }));
}

std::optional<ContentUnit> first_unread_unit(const std::vector<ContentUnit>& units, const LocalFlags& local) {
  for(auto it = units.rbegin(); it != units.rend(); ++it) {
    if(!is_read(*it, local)) return *it;
  }
  if(units.empty()) return std::nullopt;
  return units.front();
}

bool has_started_reading(const std::vector<ContentUnit>& units, const LocalFlags& local) {
  return std::any_of(units.begin(), units.end(),
    [&](const ContentUnit& u){ return is_read(u, local); });
}

int progress_percent(const ProgressRecord& progress, const ContentUnit& unit) {
  const int by_fraction = static_cast<int>(progress.position_fraction * 100.0);
  if(by_fraction > 0 && by_fraction < 100) return by_fraction;

  // Records written by page-based readers only carry the index.
  if(progress.last_index > 0 && progress.last_index != kFullyConsumedIndex && unit.page_count > 0) {
    const int by_page = static_cast<int>(static_cast<double>(progress.last_index) /
                                         static_cast<double>(unit.page_count) * 100.0);
    if(by_page > 0 && by_page < 100) return by_page;
  }
  return 0;
}

double resume_fraction(const ContentUnit& unit,
                       const std::optional<ProgressRecord>& local,
                       int page_count) {
  if(local) return local->is_complete ? 0.0 : std::min(1.0, std::max(0.0, local->position_fraction));
  if(unit.server_is_read || unit.server_last_page_read <= 0 || page_count <= 0) return 0.0;
  const int page = std::min(unit.server_last_page_read, page_count - 1);
  return layout::percentage_from_page(page, page_count);
}

std::string continue_label(const std::optional<ContentUnit>& first_unread,
                           const std::optional<ProgressRecord>& progress,
                           bool started) {
  if(!first_unread) return "Start Reading";
  const long chapter = static_cast<long>(std::trunc(first_unread->chapter_number));
  if(progress) {
    const int percent = progress_percent(*progress, *first_unread);
    if(percent > 0) return fmt::format("Continue Ch. {} • {}%", chapter, percent);
  }
  if(started) return fmt::format("Continue Ch. {}", chapter);
  return "Start Reading";
}

} // namespace read_status
