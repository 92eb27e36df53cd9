#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include "window_section.hpp"

// Vertical strip geometry for the continuous reader. Each section is a header
// followed by its pages; a page without a cached height is drawn at
// viewport_width * default_page_aspect until its image reports a size.
namespace layout {

struct Metrics {
  float viewport_width = 390.0f;
  float viewport_height = 844.0f;
  float header_height = 60.0f;
  float default_page_aspect = 1.5f;

  float default_page_height() const { return viewport_width * default_page_aspect; }
};

float page_height(const WindowSection& section, int item, const Metrics& m);
float section_height(const WindowSection& section, const Metrics& m);
float section_start(const std::vector<WindowSection>& sections, std::size_t index, const Metrics& m);
float content_height(const std::vector<WindowSection>& sections, const Metrics& m);

struct Position {
  std::size_t section = 0;
  int item = -1;  // -1 while the point is over the header
};

// Section/page under the vertical centre of the viewport.
std::optional<Position> position_at_center(const std::vector<WindowSection>& sections,
                                           float offset,
                                           const Metrics& m);

// How far the viewport centre has travelled through a section, 0..1.
double section_scroll_fraction(const std::vector<WindowSection>& sections,
                               std::size_t index,
                               float offset,
                               const Metrics& m);

// Share of a section the bottom edge of the viewport has passed, 0..1.
double section_seen_fraction(const std::vector<WindowSection>& sections,
                             std::size_t index,
                             float offset,
                             const Metrics& m);

// Progress bar across everything currently in the strip, 0..1.
double overall_fraction(float offset, float content_height, float viewport_height);

// Offset to restore after a section of inserted_height was put above the
// viewport, keeping the visible content still.
float offset_after_prepend(float offset, float inserted_height);

float clamp_offset(float offset, float content_height, float viewport_height);

// Rendered height of a page image scaled to the viewport width.
float fitted_height(int image_width, int image_height, float viewport_width);

double percentage_from_offset(float offset, float total_height, float viewport_height);
float offset_from_percentage(double percentage, float total_height, float viewport_height);
double percentage_from_page(int page_index, int total_pages);
int page_from_percentage(double percentage, int total_pages);

} // namespace layout
