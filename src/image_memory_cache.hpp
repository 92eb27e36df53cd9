#pragma once
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Memory tier of the page image cache, keyed by image_cache_key(). Entries
// are evicted least recently used once the byte budget is exceeded; the
// window manager purges whole chapters explicitly when they leave the window.
// The on-disk tier is owned by the image pipeline and never touched here.
class ImageMemoryCache {
public:
  using Payload = std::shared_ptr<const std::vector<uint8_t>>;

  explicit ImageMemoryCache(std::size_t byte_budget = 256u * 1024u * 1024u);

  void put(const std::string& key, std::vector<uint8_t> bytes);
  Payload get(const std::string& key);
  bool contains(const std::string& key) const;
  bool remove_from_memory(const std::string& key);
  void clear();

  std::size_t entry_count() const;
  std::size_t memory_bytes() const;

private:
  struct Slot {
    Payload payload;
    std::list<std::string>::iterator lru_pos;
  };

  void trim_locked();

  std::size_t byte_budget_;
  std::size_t bytes_ = 0;
  mutable std::mutex m_;
  std::list<std::string> lru_;  // front = most recent
  std::unordered_map<std::string, Slot> slots_;
};
