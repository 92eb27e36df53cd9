#include "image_memory_cache.hpp"

ImageMemoryCache::ImageMemoryCache(std::size_t byte_budget)
  : byte_budget_(byte_budget) {}

void ImageMemoryCache::put(const std::string& key, std::vector<uint8_t> bytes) {
  std::lock_guard lg(m_);
  auto it = slots_.find(key);
  if(it != slots_.end()) {
    bytes_ -= it->second.payload->size();
    lru_.erase(it->second.lru_pos);
    slots_.erase(it);
  }
  auto payload = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
  bytes_ += payload->size();
  lru_.push_front(key);
  slots_[key] = Slot{std::move(payload), lru_.begin()};
  trim_locked();
}

ImageMemoryCache::Payload ImageMemoryCache::get(const std::string& key) {
  std::lock_guard lg(m_);
  auto it = slots_.find(key);
  if(it == slots_.end()) return nullptr;
  lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
  return it->second.payload;
}

bool ImageMemoryCache::contains(const std::string& key) const {
  std::lock_guard lg(m_);
  return slots_.count(key) > 0;
}

bool ImageMemoryCache::remove_from_memory(const std::string& key) {
  std::lock_guard lg(m_);
  auto it = slots_.find(key);
  if(it == slots_.end()) return false;
  bytes_ -= it->second.payload->size();
  lru_.erase(it->second.lru_pos);
  slots_.erase(it);
  return true;
}

void ImageMemoryCache::clear() {
  std::lock_guard lg(m_);
  slots_.clear();
  lru_.clear();
  bytes_ = 0;
}

std::size_t ImageMemoryCache::entry_count() const {
  std::lock_guard lg(m_);
  return slots_.size();
}

std::size_t ImageMemoryCache::memory_bytes() const {
  std::lock_guard lg(m_);
  return bytes_;
}

void ImageMemoryCache::trim_locked() {
  // keep the newest entry even when it alone is over budget
  while(bytes_ > byte_budget_ && lru_.size() > 1) {
    const std::string& victim = lru_.back();
    auto it = slots_.find(victim);
    if(it != slots_.end()) {
      bytes_ -= it->second.payload->size();
      slots_.erase(it);
    }
    lru_.pop_back();
  }
}
