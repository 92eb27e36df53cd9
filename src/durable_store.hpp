#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "progress_record.hpp"
#include "log.hpp"

// Local persistence boundary for progress records. Implementations give
// read-your-writes consistency within the process and throw
// std::runtime_error when the backing storage fails.
class DurableStore {
public:
  virtual ~DurableStore() = default;

  virtual std::optional<ProgressRecord> get(const std::string& unit_key) = 0;
  virtual void put(const ProgressRecord& record) = 0;
  virtual std::map<std::string, ProgressRecord> get_many(const std::vector<std::string>& unit_keys);
  virtual std::vector<ProgressRecord> all() = 0;
  virtual std::size_t erase_all() = 0;
};

class MemoryProgressStore : public DurableStore {
public:
  std::optional<ProgressRecord> get(const std::string& unit_key) override;
  void put(const ProgressRecord& record) override;
  std::vector<ProgressRecord> all() override;
  std::size_t erase_all() override;

private:
  std::mutex m_;
  std::unordered_map<std::string, ProgressRecord> records_;
};

// Whole-document JSON file. Every put rewrites the file through a temporary
// sibling and a rename so a crash never leaves a torn document behind.
class JsonProgressStore : public DurableStore {
public:
  explicit JsonProgressStore(std::filesystem::path path,
                             std::shared_ptr<Logger> logger = nullptr);

  std::optional<ProgressRecord> get(const std::string& unit_key) override;
  void put(const ProgressRecord& record) override;
  std::vector<ProgressRecord> all() override;
  std::size_t erase_all() override;

  const std::filesystem::path& path() const { return path_; }
  std::size_t size() const;

private:
  void load_locked();
  void persist_locked();

  std::filesystem::path path_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex m_;
  std::unordered_map<std::string, ProgressRecord> records_;
};
