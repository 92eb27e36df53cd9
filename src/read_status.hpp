#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "content_types.hpp"
#include "progress_record.hpp"

// Read flags as the chapter list shows them: a record kept on this device
// overrides what the server reports. Chapter lists are newest first.
namespace read_status {

using LocalFlags = std::map<std::string, bool>;  // unit key -> is_complete

bool is_read(const ContentUnit& unit, const LocalFlags& local);

// Per-chapter flags in list order.
std::vector<bool> merge_read_status(const std::vector<ContentUnit>& units, const LocalFlags& local);

std::size_t unread_count(const std::vector<ContentUnit>& units, const LocalFlags& local);

// Oldest unread chapter, or the newest one when everything is read.
std::optional<ContentUnit> first_unread_unit(const std::vector<ContentUnit>& units, const LocalFlags& local);

bool has_started_reading(const std::vector<ContentUnit>& units, const LocalFlags& local);

// Whole percent shown on the continue button, truncated.
int progress_percent(const ProgressRecord& progress, const ContentUnit& unit);

// Where to reopen a chapter, 0..1. A local record wins; without one the
// server's last page read is used unless the server has the chapter as read.
double resume_fraction(const ContentUnit& unit,
                       const std::optional<ProgressRecord>& local,
                       int page_count);

std::string continue_label(const std::optional<ContentUnit>& first_unread,
                           const std::optional<ProgressRecord>& progress,
                           bool started);

} // namespace read_status
