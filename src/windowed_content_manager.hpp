#pragma once
#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "image_memory_cache.hpp"
#include "log.hpp"
#include "window_section.hpp"

// Keeps the chapters of an infinite vertical strip, with only the chapters
// within window_radius of the active one holding page payloads. Page heights
// outlive unloading so sections keep their size while empty.
//
// All entry points are safe to call from any thread; the debounce timer runs
// on the supplied io_context. Create through std::make_shared.
class WindowedContentManager : public std::enable_shared_from_this<WindowedContentManager> {
public:
  struct Options {
    std::size_t window_radius = 1;
    std::chrono::milliseconds debounce{300};
    std::string server_url;  // base for image cache keys
  };

  struct Stats {
    std::size_t loads = 0;
    std::size_t unloads = 0;
    std::size_t purged_images = 0;
    std::size_t window_updates = 0;
  };

  // Fired after the state change, outside the manager's lock.
  using SectionCallback = std::function<void(std::size_t index, SectionEvent event)>;

  WindowedContentManager(asio::io_context& io,
                         Options options,
                         std::shared_ptr<ImageMemoryCache> image_cache = nullptr,
                         std::shared_ptr<Logger> logger = nullptr);
  ~WindowedContentManager();

  WindowedContentManager(const WindowedContentManager&) = delete;
  WindowedContentManager& operator=(const WindowedContentManager&) = delete;

  void set_section_callback(SectionCallback cb);

  void set_initial_unit(const ContentUnit& unit, std::vector<SubItem> items);
  std::size_t append_unit(const ContentUnit& unit, std::vector<SubItem> items);
  // Inserts at index 0 and shifts the active index. The caller moves its
  // scroll offset down by the new section's height.
  void prepend_unit(const ContentUnit& unit, std::vector<SubItem> items);

  bool contains_unit(UnitId id) const;
  std::optional<std::size_t> index_of(UnitId id) const;

  void update_window(std::size_t active_index);
  void update_window_immediate(std::size_t active_index);

  // First height for a page wins. Returns false when rejected.
  bool cache_page_height(float height, int sub_item, std::size_t section);
  std::optional<float> cached_page_height(int sub_item, std::size_t section) const;
  // Heights depend on the viewport width; call when it changes.
  void invalidate_page_heights();

  void invalidate();
  void reset();

  std::size_t active_index() const;
  std::size_t section_count() const;
  std::size_t loaded_count() const;
  bool debounce_pending() const;
  std::optional<WindowSection> section(std::size_t index) const;
  std::vector<WindowSection> snapshot() const;
  Stats stats() const;
  const Options& options() const { return options_; }

  static bool is_valid_transition(LoadState from, LoadState to);

private:
  using Events = std::vector<std::pair<std::size_t, SectionEvent>>;

  WindowSection make_section_locked(const ContentUnit& unit, std::vector<SubItem> items);
  void transition_locked(WindowSection& section, LoadState to);
  void apply_window_locked(std::size_t active_index, Events& events);
  void release_payload_locked(const WindowSection& section);
  void cancel_debounce_locked();
  void on_debounce_fired(uint64_t generation);
  void emit(const Events& events);

  Options options_;
  std::shared_ptr<ImageMemoryCache> image_cache_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  std::vector<WindowSection> sections_;
  std::size_t active_index_ = 0;
  asio::steady_timer debounce_timer_;
  uint64_t debounce_generation_ = 0;
  std::optional<std::size_t> pending_active_;
  Stats stats_;

  std::mutex callback_mutex_;
  SectionCallback section_callback_;
};
