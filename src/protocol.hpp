#pragma once
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

// protocol.hpp
inline constexpr const char* kUpdateChapterProgressOperation = "UpdateChapterProgress";

// Mutation body pushed to the content server for one chapter.
json make_progress_mutation(const std::string& unit_key,
                            int last_page_read,
                            bool is_read);
