#include "durable_store.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace {

constexpr int kStoreFormatVersion = 1;

std::vector<ProgressRecord> sorted_values(const std::unordered_map<std::string, ProgressRecord>& map) {
  std::vector<ProgressRecord> out;
  out.reserve(map.size());
  for(const auto& kv : map) out.push_back(kv.second);
  std::sort(out.begin(), out.end(),
            [](const ProgressRecord& a, const ProgressRecord& b){ return a.unit_key < b.unit_key; });
  return out;
}

} // namespace

std::map<std::string, ProgressRecord> DurableStore::get_many(const std::vector<std::string>& unit_keys) {
  std::map<std::string, ProgressRecord> out;
  for(const auto& key : unit_keys) {
    if(auto record = get(key)) {
      out.emplace(key, std::move(*record));
    }
  }
  return out;
}

// ---- MemoryProgressStore --------------------------------------------------

std::optional<ProgressRecord> MemoryProgressStore::get(const std::string& unit_key) {
  std::lock_guard lg(m_);
  auto it = records_.find(unit_key);
  if(it == records_.end()) return std::nullopt;
  return it->second;
}

void MemoryProgressStore::put(const ProgressRecord& record) {
  std::lock_guard lg(m_);
  records_[record.unit_key] = record;
}

std::vector<ProgressRecord> MemoryProgressStore::all() {
  std::lock_guard lg(m_);
  return sorted_values(records_);
}

std::size_t MemoryProgressStore::erase_all() {
  std::lock_guard lg(m_);
  auto n = records_.size();
  records_.clear();
  return n;
}

// ---- JsonProgressStore ----------------------------------------------------

JsonProgressStore::JsonProgressStore(std::filesystem::path path, std::shared_ptr<Logger> logger)
  : path_(std::move(path)), logger_(std::move(logger)) {
  if(path_.empty()) {
    throw std::runtime_error("JsonProgressStore: empty path");
  }
  std::lock_guard lg(m_);
  load_locked();
}

void JsonProgressStore::load_locked() {
  records_.clear();
  std::error_code ec;
  if(!std::filesystem::exists(path_, ec)) return;

  std::ifstream in(path_);
  if(!in) {
    throw std::runtime_error("JsonProgressStore: unable to open " + path_.string());
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    throw std::runtime_error("JsonProgressStore: corrupt " + path_.string() + ": " + e.what());
  }

  const auto& entries = doc.contains("records") ? doc.at("records") : doc;
  if(!entries.is_array()) {
    throw std::runtime_error("JsonProgressStore: " + path_.string() + " has no records array");
  }
  std::size_t skipped = 0;
  for(const auto& entry : entries) {
    try {
      auto record = entry.get<ProgressRecord>();
      records_[record.unit_key] = std::move(record);
    } catch(const nlohmann::json::exception& e) {
      ++skipped;
      log_to(logger_.get(), LogChannel::Warn, "Skipping malformed progress entry in {}: {}", path_.string(), e.what());
    }
  }
  log_to(logger_.get(), LogChannel::Debug, "Loaded {} progress records from {} ({} skipped)",
         records_.size(), path_.string(), skipped);
}

void JsonProgressStore::persist_locked() {
  nlohmann::json doc;
  doc["version"] = kStoreFormatVersion;
  doc["records"] = sorted_values(records_);

  std::error_code ec;
  if(path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
  }
  auto tmp = path_;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if(!out) {
      throw std::runtime_error("JsonProgressStore: unable to write " + tmp.string());
    }
    out << doc.dump(2);
    out.flush();
    if(!out) {
      throw std::runtime_error("JsonProgressStore: short write to " + tmp.string());
    }
  }
  std::filesystem::rename(tmp, path_, ec);
  if(ec) {
    std::filesystem::remove(tmp, ec);
    throw std::runtime_error("JsonProgressStore: unable to replace " + path_.string());
  }
}

std::optional<ProgressRecord> JsonProgressStore::get(const std::string& unit_key) {
  std::lock_guard lg(m_);
  auto it = records_.find(unit_key);
  if(it == records_.end()) return std::nullopt;
  return it->second;
}

void JsonProgressStore::put(const ProgressRecord& record) {
  std::lock_guard lg(m_);
  auto previous = records_.find(record.unit_key);
  std::optional<ProgressRecord> rollback;
  if(previous != records_.end()) rollback = previous->second;

  records_[record.unit_key] = record;
  try {
    persist_locked();
  } catch(...) {
    if(rollback) {
      records_[record.unit_key] = *rollback;
    } else {
      records_.erase(record.unit_key);
    }
    throw;
  }
}

std::vector<ProgressRecord> JsonProgressStore::all() {
  std::lock_guard lg(m_);
  return sorted_values(records_);
}

std::size_t JsonProgressStore::erase_all() {
  std::lock_guard lg(m_);
  auto n = records_.size();
  auto saved = std::move(records_);
  records_.clear();
  try {
    persist_locked();
  } catch(...) {
    records_ = std::move(saved);
    throw;
  }
  return n;
}

std::size_t JsonProgressStore::size() const {
  std::lock_guard lg(m_);
  return records_.size();
}
