#pragma once
#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "chapter_prefetcher.hpp"
#include "log.hpp"
#include "progress_engine.hpp"
#include "reader_layout.hpp"
#include "windowed_content_manager.hpp"

// One open continuous-scroll reader. Turns scroll offsets into window
// updates, progress writes and adjacent chapter fetches.
class ReaderSession : public std::enable_shared_from_this<ReaderSession> {
public:
  struct Options {
    layout::Metrics metrics;
    std::chrono::milliseconds scroll_throttle{100};
    float prefetch_threshold_screens = 2.0f;
  };

  struct Status {
    float offset = 0.0f;
    float content_height = 0.0f;
    std::size_t active_section = 0;
    std::string active_unit_key;
    int active_item = -1;
    double section_fraction = 0.0;
    double overall_fraction = 0.0;
  };

  ReaderSession(asio::io_context& io,
                std::shared_ptr<WindowedContentManager> window,
                std::shared_ptr<ProgressReconciliationEngine> progress,
                std::shared_ptr<ChapterPrefetcher> prefetcher,
                Options options,
                std::shared_ptr<Logger> logger = nullptr);
  ~ReaderSession();

  ReaderSession(const ReaderSession&) = delete;
  ReaderSession& operator=(const ReaderSession&) = delete;

  // Starts reading a chapter, positioned at resume_fraction of it.
  void open(const ContentUnit& unit, std::vector<SubItem> items, double resume_fraction = 0.0);
  // Ends the progress session and stops timers and fetches.
  void close();

  // Scroll events are coalesced and evaluated after scroll_throttle.
  void on_scroll(float offset);
  // Scrolling stopped: evaluate at once and apply the window without delay.
  void on_settle();
  void evaluate_now();

  bool report_page_size(std::size_t section, int item, int image_width, int image_height);
  void set_viewport(float width, float height);

  float offset() const;
  Status status() const;
  layout::Metrics metrics() const;

  std::shared_ptr<WindowedContentManager> window() const { return window_; }
  std::shared_ptr<ChapterPrefetcher> prefetcher() const { return prefetcher_; }

private:
  struct Evaluation {
    std::size_t section = 0;
    std::string unit_key;
    std::string series_key;
    int item = -1;
    double fraction = 0.0;
  };

  static constexpr int kStaleSnapshotRetries = 3;

  // Shifts offset and active section past sections inserted above the first
  // chapter this session has accounted for. False when the snapshot predates
  // that chapter.
  bool compensate_prepends_locked(const std::vector<WindowSection>& sections);
  // False when sections went stale while evaluating; nothing is reported then.
  bool evaluate(const std::vector<WindowSection>& sections);
  static std::optional<Evaluation> locate(const std::vector<WindowSection>& sections,
                                          float offset,
                                          const layout::Metrics& m);
  void maybe_prefetch(const std::vector<WindowSection>& sections, float offset, const layout::Metrics& m);
  void on_prefetched(const PrefetchOutcome& outcome);
  void on_throttle_fired(uint64_t generation);

  std::shared_ptr<WindowedContentManager> window_;
  std::shared_ptr<ProgressReconciliationEngine> progress_;
  std::shared_ptr<ChapterPrefetcher> prefetcher_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  float offset_ = 0.0f;
  std::optional<std::size_t> active_section_;
  std::string active_unit_key_;
  std::string active_series_key_;
  std::optional<UnitId> first_unit_;
  asio::steady_timer throttle_timer_;
  uint64_t throttle_generation_ = 0;
  bool throttle_pending_ = false;
  bool open_ = false;
};
