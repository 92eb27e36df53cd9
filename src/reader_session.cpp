#include "reader_session.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "utils.hpp"

ReaderSession::ReaderSession(asio::io_context& io,
                             std::shared_ptr<WindowedContentManager> window,
                             std::shared_ptr<ProgressReconciliationEngine> progress,
                             std::shared_ptr<ChapterPrefetcher> prefetcher,
                             Options options,
                             std::shared_ptr<Logger> logger)
  : window_(std::move(window)),
    progress_(std::move(progress)),
    prefetcher_(std::move(prefetcher)),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("session")),
    throttle_timer_(io) {
  if(!window_ || !progress_ || !prefetcher_) {
    throw std::invalid_argument("ReaderSession: window, progress and prefetcher are required");
  }
}

ReaderSession::~ReaderSession() {
  std::lock_guard lg(m_);
  ++throttle_generation_;
  throttle_timer_.cancel();
}

void ReaderSession::open(const ContentUnit& unit, std::vector<SubItem> items, double resume_fraction) {
  prefetcher_->cancel();
  prefetcher_->reset();
  std::weak_ptr<ReaderSession> weak = weak_from_this();
  prefetcher_->set_completion_callback([weak](const PrefetchOutcome& outcome){
    if(auto self = weak.lock()) {
      self->on_prefetched(outcome);
    }
  });

  window_->set_initial_unit(unit, std::move(items));
  auto first = window_->section(0);
  if(!first) {
    throw std::runtime_error("ReaderSession: window empty after opening chapter " + unit.key());
  }
  const auto m = metrics();
  const float height = layout::section_height(*first, m);
  const float offset = layout::offset_from_percentage(clamp_fraction(resume_fraction), height, m.viewport_height);

  {
    std::lock_guard lg(m_);
    ++throttle_generation_;
    throttle_timer_.cancel();
    throttle_pending_ = false;
    offset_ = offset;
    active_section_ = 0;
    active_unit_key_ = unit.key();
    active_series_key_ = unit.series_id;
    first_unit_ = unit.id;
    open_ = true;
  }
  progress_->begin_session(unit.key());
  logger_->info("opened chapter {} ({}) at {:.0f}%", unit.key(), unit.display_name, resume_fraction * 100.0);
  evaluate_now();
}

void ReaderSession::close() {
  {
    std::lock_guard lg(m_);
    if(!open_) return;
    open_ = false;
    ++throttle_generation_;
    throttle_pending_ = false;
    throttle_timer_.cancel();
  }
  prefetcher_->cancel();
  window_->invalidate();
  progress_->end_session();
  logger_->debug("session closed");
}

void ReaderSession::on_scroll(float offset) {
  std::lock_guard lg(m_);
  if(!open_) return;
  offset_ = std::max(0.0f, offset);
  if(throttle_pending_) return;
  throttle_pending_ = true;
  const uint64_t generation = ++throttle_generation_;
  throttle_timer_.expires_after(options_.scroll_throttle);
  std::weak_ptr<ReaderSession> weak = weak_from_this();
  throttle_timer_.async_wait([weak, generation](const std::error_code& ec){
    if(ec) return;
    if(auto self = weak.lock()) {
      self->on_throttle_fired(generation);
    }
  });
}

void ReaderSession::on_throttle_fired(uint64_t generation) {
  {
    std::lock_guard lg(m_);
    if(generation != throttle_generation_) return;
    throttle_pending_ = false;
  }
  evaluate_now();
}

void ReaderSession::on_settle() {
  {
    std::lock_guard lg(m_);
    if(!open_) return;
    ++throttle_generation_;
    throttle_pending_ = false;
    throttle_timer_.cancel();
  }
  evaluate_now();
  std::optional<std::size_t> active;
  {
    std::lock_guard lg(m_);
    active = active_section_;
  }
  if(active) window_->update_window_immediate(*active);
}

bool ReaderSession::compensate_prepends_locked(const std::vector<WindowSection>& sections) {
  if(!first_unit_ || sections.empty() || sections.front().unit.id == *first_unit_) return true;
  auto it = std::find_if(sections.begin(), sections.end(),
    [&](const WindowSection& s){ return s.unit.id == *first_unit_; });
  // taken before a prepend this session already accounted for
  if(it == sections.end()) return false;
  const auto inserted = static_cast<std::size_t>(it - sections.begin());
  float inserted_height = 0.0f;
  for(std::size_t i = 0; i < inserted; ++i) {
    inserted_height += layout::section_height(sections[i], options_.metrics);
  }
  offset_ = layout::offset_after_prepend(offset_, inserted_height);
  if(active_section_) *active_section_ += inserted;
  first_unit_ = sections.front().unit.id;
  logger_->debug("{} chapter(s) inserted above, offset moved by {:.0f}", inserted, inserted_height);
  return true;
}

std::optional<ReaderSession::Evaluation> ReaderSession::locate(const std::vector<WindowSection>& sections,
                                                               float offset,
                                                               const layout::Metrics& m) {
  auto pos = layout::position_at_center(sections, offset, m);
  if(!pos) return std::nullopt;
  const auto& section = sections[pos->section];
  Evaluation eval;
  eval.section = pos->section;
  eval.unit_key = section.unit.key();
  eval.series_key = section.unit.series_id;
  eval.item = pos->item;
  eval.fraction = layout::section_scroll_fraction(sections, pos->section, offset, m);
  return eval;
}

void ReaderSession::evaluate_now() {
  for(int attempt = 0; attempt < kStaleSnapshotRetries; ++attempt) {
    if(evaluate(window_->snapshot())) return;
  }
  logger_->debug("window changed during every evaluation attempt, skipped");
}

bool ReaderSession::evaluate(const std::vector<WindowSection>& sections) {
  float offset = 0.0f;
  layout::Metrics m;
  std::string previous_key;
  std::string previous_series;
  std::optional<std::size_t> previous_section;
  {
    std::lock_guard lg(m_);
    if(!open_) return true;
    if(!compensate_prepends_locked(sections)) return false;
    m = options_.metrics;
    offset_ = layout::clamp_offset(offset_, layout::content_height(sections, m), m.viewport_height);
    offset = offset_;
    previous_key = active_unit_key_;
    previous_series = active_series_key_;
    previous_section = active_section_;
  }

  auto eval = locate(sections, offset, m);
  if(!eval) return true;

  const bool changed = eval->unit_key != previous_key;
  if(changed) {
    {
      std::lock_guard lg(m_);
      // a prepend landed since the snapshot; its indices no longer apply
      if(!first_unit_ || *first_unit_ != sections.front().unit.id) return false;
      active_section_ = eval->section;
      active_unit_key_ = eval->unit_key;
      active_series_key_ = eval->series_key;
    }
    if(previous_section && eval->section > *previous_section && !previous_key.empty()) {
      progress_->mark_unit_complete_immediate(previous_key, previous_series);
    }
    progress_->begin_session(eval->unit_key);
    window_->update_window(eval->section);
    logger_->info("now reading chapter {}", eval->unit_key);
  }

  const bool read = layout::section_seen_fraction(sections, eval->section, offset, m) >= kReadFractionThreshold;
  progress_->update_progress(eval->unit_key,
                             eval->series_key,
                             eval->fraction,
                             std::max(0, eval->item),
                             read);
  maybe_prefetch(sections, offset, m);
  return true;
}

void ReaderSession::maybe_prefetch(const std::vector<WindowSection>& sections,
                                   float offset,
                                   const layout::Metrics& m) {
  const float threshold = options_.prefetch_threshold_screens * m.viewport_height;
  const float below = layout::content_height(sections, m) - (offset + m.viewport_height);
  if(below <= threshold) prefetcher_->request(Direction::Forward);
  if(offset <= threshold) prefetcher_->request(Direction::Backward);
}

void ReaderSession::on_prefetched(const PrefetchOutcome& outcome) {
  if(outcome.status != FetchResult::Status::Found || !outcome.inserted) return;
  if(outcome.direction == Direction::Backward) {
    auto sections = window_->snapshot();
    std::lock_guard lg(m_);
    compensate_prepends_locked(sections);
  }
}

bool ReaderSession::report_page_size(std::size_t section, int item, int image_width, int image_height) {
  const float height = layout::fitted_height(image_width, image_height, metrics().viewport_width);
  return window_->cache_page_height(height, item, section);
}

void ReaderSession::set_viewport(float width, float height) {
  if(!(width > 0.0f) || !(height > 0.0f)) return;
  bool width_changed = false;
  {
    std::lock_guard lg(m_);
    width_changed = std::fabs(options_.metrics.viewport_width - width) > 0.5f;
    options_.metrics.viewport_width = width;
    options_.metrics.viewport_height = height;
  }
  if(width_changed) window_->invalidate_page_heights();
}

layout::Metrics ReaderSession::metrics() const {
  std::lock_guard lg(m_);
  return options_.metrics;
}

float ReaderSession::offset() const {
  std::lock_guard lg(m_);
  return offset_;
}

ReaderSession::Status ReaderSession::status() const {
  auto sections = window_->snapshot();
  Status st;
  layout::Metrics m;
  {
    std::lock_guard lg(m_);
    m = options_.metrics;
    st.offset = offset_;
    st.active_section = active_section_.value_or(0);
    st.active_unit_key = active_unit_key_;
  }
  st.content_height = layout::content_height(sections, m);
  st.overall_fraction = layout::overall_fraction(st.offset, st.content_height, m.viewport_height);
  if(auto pos = layout::position_at_center(sections, st.offset, m)) {
    st.active_item = pos->item;
    st.section_fraction = layout::section_scroll_fraction(sections, pos->section, st.offset, m);
  }
  return st;
}
