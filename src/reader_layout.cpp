#include "reader_layout.hpp"

#include <algorithm>
#include <cmath>

namespace layout {

float page_height(const WindowSection& section, int item, const Metrics& m) {
  auto it = section.sub_item_heights.find(item);
  if(it != section.sub_item_heights.end()) return it->second;
  return m.default_page_height();
}

float section_height(const WindowSection& section, const Metrics& m) {
  float total = m.header_height;
  for(std::size_t i = 0; i < section.items.size(); ++i) {
    total += page_height(section, static_cast<int>(i), m);
  }
  return total;
}

float section_start(const std::vector<WindowSection>& sections, std::size_t index, const Metrics& m) {
  float y = 0.0f;
  const std::size_t end = std::min(index, sections.size());
  for(std::size_t i = 0; i < end; ++i) {
    y += section_height(sections[i], m);
  }
  return y;
}

float content_height(const std::vector<WindowSection>& sections, const Metrics& m) {
  return section_start(sections, sections.size(), m);
}

std::optional<Position> position_at_center(const std::vector<WindowSection>& sections,
                                           float offset,
                                           const Metrics& m) {
  if(sections.empty()) return std::nullopt;
  const float center = offset + m.viewport_height / 2.0f;
  float y = 0.0f;
  for(std::size_t s = 0; s < sections.size(); ++s) {
    const float height = section_height(sections[s], m);
    if(center < y + height || s + 1 == sections.size()) {
      Position pos;
      pos.section = s;
      float local = center - y - m.header_height;
      if(local < 0.0f) return pos;
      for(std::size_t i = 0; i < sections[s].items.size(); ++i) {
        local -= page_height(sections[s], static_cast<int>(i), m);
        pos.item = static_cast<int>(i);
        if(local < 0.0f) break;
      }
      return pos;
    }
    y += height;
  }
  return std::nullopt;
}

double section_scroll_fraction(const std::vector<WindowSection>& sections,
                               std::size_t index,
                               float offset,
                               const Metrics& m) {
  if(index >= sections.size()) return 0.0;
  const float start = section_start(sections, index, m);
  const float height = section_height(sections[index], m);
  if(height <= 0.0f) return 0.0;
  const float travelled = offset - start + m.viewport_height / 2.0f;
  return std::min(1.0, std::max(0.0, static_cast<double>(travelled / height)));
}

double section_seen_fraction(const std::vector<WindowSection>& sections,
                             std::size_t index,
                             float offset,
                             const Metrics& m) {
  if(index >= sections.size()) return 0.0;
  const float height = section_height(sections[index], m);
  if(height <= 0.0f) return 0.0;
  const float seen = offset + m.viewport_height - section_start(sections, index, m);
  return std::min(1.0, std::max(0.0, static_cast<double>(seen / height)));
}

double overall_fraction(float offset, float content_height, float viewport_height) {
  const float scrollable = content_height - viewport_height;
  if(scrollable <= 0.0f) return 0.0;
  return std::min(1.0, std::max(0.0, static_cast<double>(offset / scrollable)));
}

float offset_after_prepend(float offset, float inserted_height) {
  return offset + inserted_height;
}

float clamp_offset(float offset, float content_height, float viewport_height) {
  const float max_offset = std::max(0.0f, content_height - viewport_height);
  return std::min(std::max(0.0f, offset), max_offset);
}

float fitted_height(int image_width, int image_height, float viewport_width) {
  if(image_width <= 0 || image_height <= 0) return 0.0f;
  return viewport_width * (static_cast<float>(image_height) / static_cast<float>(image_width));
}

double percentage_from_offset(float offset, float total_height, float viewport_height) {
  return overall_fraction(offset, total_height, viewport_height);
}

float offset_from_percentage(double percentage, float total_height, float viewport_height) {
  const float scrollable = total_height - viewport_height;
  if(scrollable <= 0.0f) return 0.0f;
  return static_cast<float>(percentage) * scrollable;
}

double percentage_from_page(int page_index, int total_pages) {
  if(total_pages <= 1) return 0.0;
  return static_cast<double>(page_index) / static_cast<double>(total_pages - 1);
}

int page_from_percentage(double percentage, int total_pages) {
  if(total_pages <= 1) return 0;
  return static_cast<int>(std::lround(percentage * static_cast<double>(total_pages - 1)));
}

} // namespace layout
