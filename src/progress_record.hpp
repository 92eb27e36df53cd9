#pragma once
#include <chrono>
#include <climits>
#include <string>
#include <nlohmann/json.hpp>

using Timestamp = std::chrono::system_clock::time_point;

// last_index value meaning the chapter was read to the end.
inline constexpr int kFullyConsumedIndex = INT_MAX;

// A chapter scrolled at least this far counts as read.
inline constexpr double kReadFractionThreshold = 0.95;

struct ProgressRecord {
  std::string unit_key;
  std::string series_key;
  double position_fraction = 0.0;  // 0.0 - 1.0
  Timestamp updated_at{};
  bool is_complete = false;
  int last_index = 0;
};

// Buffered, not yet durable. One per unit_key; a newer update replaces it.
struct PendingUpdate {
  std::string unit_key;
  std::string series_key;
  double position_fraction = 0.0;
  int index = 0;
  bool is_complete = false;
  Timestamp timestamp{};

  ProgressRecord to_record() const {
    ProgressRecord r;
    r.unit_key = unit_key;
    r.series_key = series_key;
    r.position_fraction = position_fraction;
    r.updated_at = timestamp;
    r.is_complete = is_complete;
    r.last_index = index;
    return r;
  }
};

bool operator==(const ProgressRecord& a, const ProgressRecord& b);
inline bool operator!=(const ProgressRecord& a, const ProgressRecord& b) { return !(a == b); }

void to_json(nlohmann::json& j, const ProgressRecord& record);
void from_json(const nlohmann::json& j, ProgressRecord& record);
