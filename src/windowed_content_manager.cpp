#include "windowed_content_manager.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "utils.hpp"

WindowedContentManager::WindowedContentManager(asio::io_context& io,
                                               Options options,
                                               std::shared_ptr<ImageMemoryCache> image_cache,
                                               std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    image_cache_(std::move(image_cache)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("window")),
    debounce_timer_(io) {}

WindowedContentManager::~WindowedContentManager() {
  std::lock_guard lg(m_);
  cancel_debounce_locked();
}

void WindowedContentManager::set_section_callback(SectionCallback cb) {
  std::lock_guard lg(callback_mutex_);
  section_callback_ = std::move(cb);
}

bool WindowedContentManager::is_valid_transition(LoadState from, LoadState to) {
  switch(from) {
    case LoadState::NotLoaded: return to == LoadState::Loading;
    case LoadState::Loading:   return to == LoadState::Loaded;
    case LoadState::Loaded:    return to == LoadState::Unloaded;
    case LoadState::Unloaded:  return to == LoadState::Loaded;
  }
  return false;
}

void WindowedContentManager::transition_locked(WindowSection& section, LoadState to) {
  if(!is_valid_transition(section.load_state, to)) {
    throw std::logic_error(std::string("chapter ") + section.unit.key() +
                           ": illegal transition " + to_string(section.load_state) +
                           " -> " + to_string(to));
  }
  section.load_state = to;
}

WindowSection WindowedContentManager::make_section_locked(const ContentUnit& unit, std::vector<SubItem> items) {
  WindowSection section;
  section.unit = unit;
  transition_locked(section, LoadState::Loading);
  section.items = std::move(items);
  transition_locked(section, LoadState::Loaded);
  ++stats_.loads;
  return section;
}

void WindowedContentManager::set_initial_unit(const ContentUnit& unit, std::vector<SubItem> items) {
  Events events;
  const std::size_t page_count = items.size();
  {
    std::lock_guard lg(m_);
    cancel_debounce_locked();
    for(const auto& old : sections_) {
      if(old.load_state == LoadState::Loaded) release_payload_locked(old);
    }
    sections_.clear();
    sections_.push_back(make_section_locked(unit, std::move(items)));
    active_index_ = 0;
    events.emplace_back(0, SectionEvent::Inserted);
  }
  logger_->debug("initial chapter {} ({} pages)", unit.key(), page_count);
  emit(events);
}

std::size_t WindowedContentManager::append_unit(const ContentUnit& unit, std::vector<SubItem> items) {
  std::size_t index = 0;
  {
    std::lock_guard lg(m_);
    sections_.push_back(make_section_locked(unit, std::move(items)));
    index = sections_.size() - 1;
  }
  logger_->debug("appended chapter {} at section {}", unit.key(), index);
  emit({{index, SectionEvent::Inserted}});
  return index;
}

void WindowedContentManager::prepend_unit(const ContentUnit& unit, std::vector<SubItem> items) {
  {
    std::lock_guard lg(m_);
    sections_.insert(sections_.begin(), make_section_locked(unit, std::move(items)));
    if(sections_.size() > 1) ++active_index_;
    if(pending_active_) ++*pending_active_;
  }
  logger_->debug("prepended chapter {}", unit.key());
  emit({{0, SectionEvent::Inserted}});
}

bool WindowedContentManager::contains_unit(UnitId id) const {
  return index_of(id).has_value();
}

std::optional<std::size_t> WindowedContentManager::index_of(UnitId id) const {
  std::lock_guard lg(m_);
  for(std::size_t i = 0; i < sections_.size(); ++i) {
    if(sections_[i].unit.id == id) return i;
  }
  return std::nullopt;
}

void WindowedContentManager::update_window(std::size_t active_index) {
  std::lock_guard lg(m_);
  const uint64_t generation = ++debounce_generation_;
  pending_active_ = active_index;
  debounce_timer_.expires_after(options_.debounce);
  std::weak_ptr<WindowedContentManager> weak = weak_from_this();
  debounce_timer_.async_wait([weak, generation](const std::error_code& ec){
    if(ec) return;
    if(auto self = weak.lock()) {
      self->on_debounce_fired(generation);
    }
  });
}

void WindowedContentManager::on_debounce_fired(uint64_t generation) {
  Events events;
  {
    std::lock_guard lg(m_);
    if(generation != debounce_generation_ || !pending_active_) return;
    auto target = *pending_active_;
    pending_active_.reset();
    apply_window_locked(target, events);
  }
  emit(events);
}

void WindowedContentManager::update_window_immediate(std::size_t active_index) {
  Events events;
  {
    std::lock_guard lg(m_);
    cancel_debounce_locked();
    apply_window_locked(active_index, events);
  }
  emit(events);
}

void WindowedContentManager::apply_window_locked(std::size_t active_index, Events& events) {
  if(active_index >= sections_.size()) {
    logger_->debug("ignoring window update for section {} of {}", active_index, sections_.size());
    return;
  }
  ++stats_.window_updates;
  active_index_ = active_index;

  const std::size_t radius = options_.window_radius;
  const std::size_t first = active_index > radius ? active_index - radius : 0;
  const std::size_t last = std::min(sections_.size() - 1, active_index + radius);

  for(std::size_t i = first; i <= last; ++i) {
    auto& section = sections_[i];
    if(section.load_state != LoadState::Unloaded) continue;
    transition_locked(section, LoadState::Loaded);
    ++stats_.loads;
    events.emplace_back(i, SectionEvent::Loaded);
  }

  for(std::size_t i = 0; i < sections_.size(); ++i) {
    if(i >= first && i <= last) continue;
    auto& section = sections_[i];
    if(section.load_state != LoadState::Loaded) continue;
    release_payload_locked(section);
    transition_locked(section, LoadState::Unloaded);
    ++stats_.unloads;
    events.emplace_back(i, SectionEvent::Unloaded);
  }

  if(!events.empty()) {
    logger_->debug("window [{}, {}] around {}: {} transitions", first, last, active_index, events.size());
  }
}

void WindowedContentManager::release_payload_locked(const WindowSection& section) {
  if(!image_cache_) return;
  for(const auto& item : section.items) {
    if(item.url.empty()) continue;
    if(image_cache_->remove_from_memory(image_cache_key(options_.server_url, item.url))) {
      ++stats_.purged_images;
    }
  }
}

bool WindowedContentManager::cache_page_height(float height, int sub_item, std::size_t section) {
  if(!std::isfinite(height) || height <= 0.0f || sub_item < 0) return false;
  std::lock_guard lg(m_);
  if(section >= sections_.size()) return false;
  auto& s = sections_[section];
  if(static_cast<std::size_t>(sub_item) >= s.items.size()) return false;
  return s.sub_item_heights.emplace(sub_item, height).second;
}

std::optional<float> WindowedContentManager::cached_page_height(int sub_item, std::size_t section) const {
  std::lock_guard lg(m_);
  if(section >= sections_.size()) return std::nullopt;
  const auto& heights = sections_[section].sub_item_heights;
  auto it = heights.find(sub_item);
  if(it == heights.end()) return std::nullopt;
  return it->second;
}

void WindowedContentManager::invalidate_page_heights() {
  std::size_t dropped = 0;
  {
    std::lock_guard lg(m_);
    for(auto& s : sections_) {
      dropped += s.sub_item_heights.size();
      s.sub_item_heights.clear();
    }
  }
  logger_->debug("dropped {} cached page heights", dropped);
}

void WindowedContentManager::cancel_debounce_locked() {
  ++debounce_generation_;
  pending_active_.reset();
  debounce_timer_.cancel();
}

void WindowedContentManager::invalidate() {
  std::lock_guard lg(m_);
  cancel_debounce_locked();
}

void WindowedContentManager::reset() {
  std::lock_guard lg(m_);
  cancel_debounce_locked();
  for(const auto& s : sections_) {
    if(s.load_state == LoadState::Loaded) release_payload_locked(s);
  }
  sections_.clear();
  active_index_ = 0;
}

std::size_t WindowedContentManager::active_index() const {
  std::lock_guard lg(m_);
  return active_index_;
}

std::size_t WindowedContentManager::section_count() const {
  std::lock_guard lg(m_);
  return sections_.size();
}

std::size_t WindowedContentManager::loaded_count() const {
  std::lock_guard lg(m_);
  return static_cast<std::size_t>(std::count_if(sections_.begin(), sections_.end(),
    [](const WindowSection& s){ return s.load_state == LoadState::Loaded; }));
}

bool WindowedContentManager::debounce_pending() const {
  std::lock_guard lg(m_);
  return pending_active_.has_value();
}

std::optional<WindowSection> WindowedContentManager::section(std::size_t index) const {
  std::lock_guard lg(m_);
  if(index >= sections_.size()) return std::nullopt;
  return sections_[index];
}

std::vector<WindowSection> WindowedContentManager::snapshot() const {
  std::lock_guard lg(m_);
  return sections_;
}

WindowedContentManager::Stats WindowedContentManager::stats() const {
  std::lock_guard lg(m_);
  return stats_;
}

void WindowedContentManager::emit(const Events& events) {
  if(events.empty()) return;
  SectionCallback cb;
  {
    std::lock_guard lg(callback_mutex_);
    cb = section_callback_;
  }
  if(!cb) return;
  for(const auto& [index, event] : events) {
    cb(index, event);
  }
}
