#include "chapter_prefetcher.hpp"
#include "content_source.hpp"
#include "durable_store.hpp"
#include "image_memory_cache.hpp"
#include "progress_engine.hpp"
#include "reader_layout.hpp"
#include "reader_session.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"
#include "windowed_content_manager.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <future>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using scrollkeeper::test::IoThread;
using scrollkeeper::test::TestCase;
using scrollkeeper::test::TestContext;
using scrollkeeper::test::make_catalog;
using scrollkeeper::test::make_pages;
using scrollkeeper::test::make_unit;
using scrollkeeper::test::wait_for_condition;

const std::string kServer = "http://reader.local:4567";

layout::Metrics test_metrics() {
  layout::Metrics m;
  m.viewport_width = 100.0f;
  m.viewport_height = 200.0f;
  m.header_height = 10.0f;
  m.default_page_aspect = 1.0f;  // 100px pages, 410px chapters of four pages
  return m;
}

bool near(double a, double b, double eps = 1e-3) {
  return std::fabs(a - b) < eps;
}

std::shared_ptr<WindowedContentManager> make_window(asio::io_context& io,
                                                    std::size_t radius,
                                                    std::chrono::milliseconds debounce = 300ms,
                                                    std::shared_ptr<ImageMemoryCache> cache = nullptr,
                                                    std::shared_ptr<Logger> logger = nullptr) {
  WindowedContentManager::Options options;
  options.window_radius = radius;
  options.debounce = debounce;
  options.server_url = kServer;
  return std::make_shared<WindowedContentManager>(io, options, std::move(cache), std::move(logger));
}

// Chapters 1..count placed in reading order.
void fill_window(WindowedContentManager& window, int count) {
  window.set_initial_unit(make_unit(101, 1), make_pages(101, 4));
  for(int n = 2; n <= count; ++n) {
    window.append_unit(make_unit(100 + n, n), make_pages(100 + n, 4));
  }
}

bool loaded_only_within(const WindowedContentManager& window, std::size_t active, std::size_t radius) {
  auto sections = window.snapshot();
  for(std::size_t i = 0; i < sections.size(); ++i) {
    const bool inside = i + radius >= active && i <= active + radius;
    if(!inside && sections[i].load_state == LoadState::Loaded) return false;
  }
  return true;
}

// Holds fetches until released.
class GatedSource : public ContentSource {
public:
  explicit GatedSource(std::shared_ptr<ContentSource> inner)
    : inner_(std::move(inner)), gate_(released_.get_future().share()) {}

  FetchResult fetch_adjacent(UnitId from, Direction direction) override {
    gate_.wait();
    return inner_->fetch_adjacent(from, direction);
  }

  std::vector<SubItem> fetch_items(UnitId id) override {
    return inner_->fetch_items(id);
  }

  void release() {
    std::call_once(once_, [this]{ released_.set_value(); });
  }

private:
  std::shared_ptr<ContentSource> inner_;
  std::promise<void> released_;
  std::shared_future<void> gate_;
  std::once_flag once_;
};

class OutcomeLog {
public:
  void add(const PrefetchOutcome& outcome) {
    std::lock_guard lg(m_);
    outcomes_.push_back(outcome);
  }
  std::size_t size() const {
    std::lock_guard lg(m_);
    return outcomes_.size();
  }
  PrefetchOutcome at(std::size_t i) const {
    std::lock_guard lg(m_);
    return outcomes_.at(i);
  }
  ChapterPrefetcher::CompletionCallback callback() {
    return [this](const PrefetchOutcome& o){ add(o); };
  }

private:
  mutable std::mutex m_;
  std::vector<PrefetchOutcome> outcomes_;
};

struct ReaderRig {
  IoThread io;
  std::shared_ptr<Logger> logger = std::make_shared<Logger>("window-test");
  std::shared_ptr<CatalogContentSource> catalog;
  std::shared_ptr<GatedSource> gate;  // set when fetches wait for release()
  std::shared_ptr<WindowedContentManager> window;
  std::shared_ptr<ProgressReconciliationEngine> progress;
  std::shared_ptr<ChapterPrefetcher> prefetcher;
  std::shared_ptr<ReaderSession> session;

  ReaderRig(TestContext& ctx, int chapters, bool gated = false) {
    ctx.logs.attach(logger);
    catalog = make_catalog(chapters);
    std::shared_ptr<ContentSource> source = catalog;
    if(gated) {
      gate = std::make_shared<GatedSource>(catalog);
      source = gate;
    }
    window = make_window(io.io(), 1, 20ms, nullptr, logger);
    ProgressReconciliationEngine::Options progress_options;
    progress_options.debounce = 50ms;
    progress = std::make_shared<ProgressReconciliationEngine>(io.io(), progress_options,
                                                              std::make_shared<MemoryProgressStore>(),
                                                              nullptr, logger);
    ChapterPrefetcher::Options prefetch_options;
    prefetch_options.timeout = 2s;
    prefetch_options.retry_after = 50ms;
    prefetcher = std::make_shared<ChapterPrefetcher>(io.io(), window, source, prefetch_options, logger);
    ReaderSession::Options session_options;
    session_options.metrics = test_metrics();
    session_options.scroll_throttle = 20ms;
    session = std::make_shared<ReaderSession>(io.io(), window, progress, prefetcher, session_options, logger);
  }

  ~ReaderRig() {
    if(gate) gate->release();
    session->close();
    progress->shutdown();
  }

  void open(UnitId id, double resume = 0.0) {
    auto unit = catalog->unit(id);
    session->open(*unit, catalog->fetch_items(id), resume);
  }
};

bool test_window_stays_within_radius(TestContext& ctx) {
  IoThread io;
  auto logger = std::make_shared<Logger>("window-test");
  ctx.logs.attach(logger);
  auto window = make_window(io.io(), 1, 300ms, nullptr, logger);
  window->set_initial_unit(make_unit(101, 1), make_pages(101, 4));
  window->update_window_immediate(0);
  for(int n = 2; n <= 5; ++n) {
    window->append_unit(make_unit(100 + n, n), make_pages(100 + n, 4));
    window->update_window_immediate(0);
    if(window->loaded_count() > 2 || !loaded_only_within(*window, 0, 1)) return false;
  }

  for(std::size_t active = 0; active < 5; ++active) {
    window->update_window_immediate(active);
    if(window->loaded_count() > 3) return false;
    if(!loaded_only_within(*window, active, 1)) return false;
    if(window->active_index() != active) return false;
  }
  auto first = window->section(0);
  auto last = window->section(4);
  return first && first->load_state == LoadState::Unloaded && first->items.size() == 4 &&
         last && last->load_state == LoadState::Loaded &&
         window->loaded_count() == 2;
}

bool test_out_of_range_update_ignored(TestContext&) {
  IoThread io;
  auto window = make_window(io.io(), 1);
  fill_window(*window, 3);
  window->update_window_immediate(1);
  window->update_window_immediate(7);
  return window->active_index() == 1 && window->stats().window_updates == 1;
}

bool test_heights_survive_unload(TestContext&) {
  IoThread io;
  auto window = make_window(io.io(), 1);
  fill_window(*window, 4);
  if(!window->cache_page_height(250.0f, 1, 0)) return false;

  window->update_window_immediate(3);
  auto unloaded = window->section(0);
  auto while_unloaded = window->cached_page_height(1, 0);
  window->update_window_immediate(0);
  auto reloaded = window->section(0);
  auto after_reload = window->cached_page_height(1, 0);

  return unloaded && unloaded->load_state == LoadState::Unloaded &&
         while_unloaded && near(*while_unloaded, 250.0) &&
         reloaded && reloaded->load_state == LoadState::Loaded &&
         after_reload && near(*after_reload, 250.0) &&
         near(layout::section_height(*reloaded, test_metrics()), 10.0 + 250.0 + 3 * 100.0);
}

bool test_first_height_wins(TestContext&) {
  IoThread io;
  auto window = make_window(io.io(), 1);
  fill_window(*window, 2);

  bool first = window->cache_page_height(120.0f, 2, 1);
  bool second = window->cache_page_height(180.0f, 2, 1);
  auto kept = window->cached_page_height(2, 1);
  bool rejected = !window->cache_page_height(std::numeric_limits<float>::quiet_NaN(), 0, 0) &&
                  !window->cache_page_height(std::numeric_limits<float>::infinity(), 0, 0) &&
                  !window->cache_page_height(0.0f, 0, 0) &&
                  !window->cache_page_height(-5.0f, 0, 0) &&
                  !window->cache_page_height(100.0f, 0, 9) &&
                  !window->cache_page_height(100.0f, 4, 0) &&
                  !window->cache_page_height(100.0f, -1, 0);

  window->invalidate_page_heights();
  bool dropped = !window->cached_page_height(2, 1).has_value();
  bool rewritten = window->cache_page_height(180.0f, 2, 1);
  return first && !second && kept && near(*kept, 120.0) && rejected && dropped && rewritten;
}

bool test_unload_purges_images(TestContext&) {
  IoThread io;
  auto cache = std::make_shared<ImageMemoryCache>();
  auto window = make_window(io.io(), 1, 300ms, cache);
  fill_window(*window, 3);

  for(UnitId id : {101, 102}) {
    for(const auto& page : make_pages(id, 4)) {
      cache->put(image_cache_key(kServer, page.url), std::vector<uint8_t>(64, 0x7f));
    }
  }
  if(cache->entry_count() != 8) return false;

  window->update_window_immediate(2);
  bool purged = true;
  for(const auto& page : make_pages(101, 4)) {
    if(cache->contains(image_cache_key(kServer, page.url))) purged = false;
  }
  bool kept = cache->contains(image_cache_key(kServer, make_pages(102, 4)[0].url));
  return purged && kept && cache->entry_count() == 4 &&
         window->stats().purged_images == 4 && window->stats().unloads == 1;
}

bool test_debounce_coalesces(TestContext&) {
  IoThread io;
  auto window = make_window(io.io(), 0, 50ms);
  fill_window(*window, 3);
  window->update_window(1);
  window->update_window(2);
  if(!window->debounce_pending()) return false;

  bool fired = wait_for_condition([&]{ return !window->debounce_pending(); }, 2s);
  io.sync();
  auto sections = window->snapshot();
  return fired && window->stats().window_updates == 1 && window->active_index() == 2 &&
         sections[0].load_state == LoadState::Unloaded &&
         sections[1].load_state == LoadState::Unloaded &&
         sections[2].load_state == LoadState::Loaded;
}

bool test_invalidate_cancels_debounce(TestContext&) {
  IoThread io;
  auto window = make_window(io.io(), 0, 80ms);
  fill_window(*window, 3);
  window->update_window(2);
  window->invalidate();
  std::this_thread::sleep_for(200ms);
  io.sync();
  return !window->debounce_pending() &&
         window->stats().window_updates == 0 &&
         window->loaded_count() == 3;
}

bool test_prepend_shifts_active_index(TestContext&) {
  IoThread io;
  auto window = make_window(io.io(), 1, 50ms);
  window->set_initial_unit(make_unit(105, 5), make_pages(105, 4));
  window->append_unit(make_unit(106, 6), make_pages(106, 4));
  window->update_window_immediate(1);
  window->update_window(1);
  window->prepend_unit(make_unit(104, 4), make_pages(104, 4));

  bool shifted = window->active_index() == 2 &&
                 window->index_of(104) == std::optional<std::size_t>(0) &&
                 window->index_of(106) == std::optional<std::size_t>(2);
  bool fired = wait_for_condition([&]{ return !window->debounce_pending(); }, 2s);
  io.sync();
  return shifted && fired && window->active_index() == 2 &&
         window->contains_unit(105) && !window->contains_unit(107);
}

bool test_section_events(TestContext&) {
  IoThread io;
  auto window = make_window(io.io(), 0);
  std::vector<std::pair<std::size_t, SectionEvent>> events;
  window->set_section_callback([&](std::size_t index, SectionEvent event){
    events.emplace_back(index, event);
  });
  fill_window(*window, 2);
  window->update_window_immediate(1);
  window->update_window_immediate(0);

  using E = SectionEvent;
  std::vector<std::pair<std::size_t, SectionEvent>> expected = {
    {0, E::Inserted}, {1, E::Inserted},
    {0, E::Unloaded},
    {0, E::Loaded}, {1, E::Unloaded},
  };
  return events == expected;
}

bool test_load_state_transitions(TestContext&) {
  using S = LoadState;
  auto ok = &WindowedContentManager::is_valid_transition;
  return ok(S::NotLoaded, S::Loading) &&
         ok(S::Loading, S::Loaded) &&
         ok(S::Loaded, S::Unloaded) &&
         ok(S::Unloaded, S::Loaded) &&
         !ok(S::NotLoaded, S::Loaded) &&
         !ok(S::Loaded, S::Loading) &&
         !ok(S::Unloaded, S::NotLoaded) &&
         !ok(S::Loading, S::Unloaded) &&
         !ok(S::Loaded, S::Loaded);
}

bool test_reset_clears_window(TestContext&) {
  IoThread io;
  auto cache = std::make_shared<ImageMemoryCache>();
  auto window = make_window(io.io(), 1, 300ms, cache);
  fill_window(*window, 2);
  cache->put(image_cache_key(kServer, make_pages(101, 4)[0].url), std::vector<uint8_t>(8, 1));
  window->reset();
  return window->section_count() == 0 && window->active_index() == 0 &&
         cache->entry_count() == 0 && !window->section(0);
}

bool test_prefetch_boundary_and_failure(TestContext& ctx) {
  IoThread io;
  auto logger = std::make_shared<Logger>("prefetch-test");
  ctx.logs.attach(logger);
  auto catalog = make_catalog(3);
  auto window = make_window(io.io(), 1, 300ms, nullptr, logger);
  window->set_initial_unit(*catalog->unit(102), catalog->fetch_items(102));

  ChapterPrefetcher::Options options;
  options.timeout = 2s;
  options.retry_after = 150ms;
  auto prefetcher = std::make_shared<ChapterPrefetcher>(io.io(), window, catalog, options, logger);
  OutcomeLog log;
  prefetcher->set_completion_callback(log.callback());

  // next chapter appended
  if(!prefetcher->request(Direction::Forward)) return false;
  if(!wait_for_condition([&]{ return log.size() == 1; }, 2s)) return false;
  auto found = log.at(0);
  bool appended = found.status == FetchResult::Status::Found && found.inserted &&
                  found.unit_id == 103 && found.section_index == std::optional<std::size_t>(1);

  // nothing after the newest chapter
  prefetcher->request(Direction::Forward);
  if(!wait_for_condition([&]{ return log.size() == 2; }, 2s)) return false;
  bool boundary = log.at(1).status == FetchResult::Status::Boundary &&
                  prefetcher->reached_end(Direction::Forward) &&
                  !prefetcher->request(Direction::Forward);

  // transient failure, blocked only until retry_after
  catalog->inject_failures(1);
  prefetcher->request(Direction::Backward);
  if(!wait_for_condition([&]{ return log.size() == 3; }, 2s)) return false;
  auto failed = log.at(2);
  bool failure = failed.status == FetchResult::Status::Failed &&
                 failed.error == "injected failure" &&
                 !prefetcher->reached_end(Direction::Backward) &&
                 prefetcher->last_failure(Direction::Backward) == std::optional<std::string>("injected failure") &&
                 !prefetcher->request(Direction::Backward);

  std::this_thread::sleep_for(200ms);
  bool retried = prefetcher->request(Direction::Backward);
  if(!wait_for_condition([&]{ return log.size() == 4; }, 2s)) return false;
  auto prepended = log.at(3);
  return appended && boundary && failure && retried &&
         prepended.status == FetchResult::Status::Found && prepended.unit_id == 101 &&
         window->index_of(101) == std::optional<std::size_t>(0) &&
         window->section_count() == 3 &&
         !prefetcher->last_failure(Direction::Backward);
}

bool test_prefetch_cancel_drops_late_result(TestContext&) {
  IoThread io;
  auto catalog = make_catalog(3);
  auto gated = std::make_shared<GatedSource>(catalog);
  auto window = make_window(io.io(), 1);
  window->set_initial_unit(*catalog->unit(102), catalog->fetch_items(102));

  auto prefetcher = std::make_shared<ChapterPrefetcher>(io.io(), window, gated, ChapterPrefetcher::Options{});
  OutcomeLog log;
  prefetcher->set_completion_callback(log.callback());

  bool started = prefetcher->request(Direction::Forward);
  prefetcher->cancel();
  bool idle = !prefetcher->in_flight(Direction::Forward);
  gated->release();
  std::this_thread::sleep_for(100ms);
  io.sync();
  return started && idle && log.size() == 0 && window->section_count() == 1;
}

bool test_prefetch_timeout(TestContext& ctx) {
  IoThread io;
  auto logger = std::make_shared<Logger>("prefetch-test");
  ctx.logs.attach(logger);
  auto catalog = make_catalog(3);
  auto gated = std::make_shared<GatedSource>(catalog);
  auto window = make_window(io.io(), 1);
  window->set_initial_unit(*catalog->unit(102), catalog->fetch_items(102));

  ChapterPrefetcher::Options options;
  options.timeout = 50ms;
  options.retry_after = 5s;
  auto prefetcher = std::make_shared<ChapterPrefetcher>(io.io(), window, gated, options, logger);
  OutcomeLog log;
  prefetcher->set_completion_callback(log.callback());

  prefetcher->request(Direction::Backward);
  bool timed_out = wait_for_condition([&]{ return log.size() == 1; }, 2s);
  gated->release();
  std::this_thread::sleep_for(100ms);
  io.sync();

  auto failure = prefetcher->last_failure(Direction::Backward);
  return timed_out && log.size() == 1 && log.at(0).timed_out &&
         log.at(0).status == FetchResult::Status::Failed &&
         failure && failure->find("timed out") != std::string::npos &&
         window->section_count() == 1 &&
         !prefetcher->request(Direction::Backward) &&
         ctx.logs.contains("fetch timed out after 50 ms");
}

bool test_session_resumes_at_fraction(TestContext& ctx) {
  ReaderRig rig(ctx, 1);
  rig.open(101, 0.5);
  // 410px chapter in a 200px viewport: half of the 210px scroll range
  bool placed = near(rig.session->offset(), 105.0);
  auto status = rig.session->status();
  return placed && status.active_unit_key == "101" && status.active_section == 0 &&
         rig.progress->active_session() == std::optional<std::string>("101");
}

bool test_prepend_keeps_reading_position(TestContext& ctx) {
  ReaderRig rig(ctx, 3);
  rig.open(102);

  bool grown = wait_for_condition([&]{ return rig.window->section_count() == 3; }, 2s);
  bool compensated = wait_for_condition([&]{ return near(rig.session->offset(), 410.0); }, 2s);
  rig.io.sync([&]{ rig.session->evaluate_now(); });

  auto status = rig.session->status();
  return grown && compensated &&
         rig.window->index_of(101) == std::optional<std::size_t>(0) &&
         rig.window->active_index() == 1 &&
         status.active_section == 1 && status.active_unit_key == "102" &&
         status.active_item == 0;
}

bool test_prepend_while_settling(TestContext& ctx) {
  for(int run = 0; run < 5; ++run) {
    ReaderRig rig(ctx, 3, true);
    rig.open(102);
    std::atomic<bool> stop{false};
    std::thread settler([&]{
      while(!stop) {
        rig.session->on_settle();
        std::this_thread::sleep_for(200us);
      }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(2 * run));
    rig.gate->release();
    bool grown = wait_for_condition([&]{ return rig.window->section_count() == 3; }, 2s);
    std::this_thread::sleep_for(20ms);
    stop = true;
    settler.join();
    rig.session->on_settle();

    auto status = rig.session->status();
    if(!grown || !near(rig.session->offset(), 410.0) ||
       status.active_unit_key != "102" || status.active_section != 1 ||
       rig.window->index_of(101) != std::optional<std::size_t>(0)) {
      return false;
    }
  }
  return true;
}

bool test_leaving_chapter_marks_it_complete(TestContext& ctx) {
  ReaderRig rig(ctx, 2);
  rig.open(101);
  if(!wait_for_condition([&]{ return rig.window->section_count() == 2; }, 2s)) return false;

  rig.session->on_scroll(420.0f);
  rig.session->on_settle();
  rig.progress->drain();

  auto previous = rig.progress->get_progress("101");
  return previous && previous->is_complete &&
         previous->last_index == kFullyConsumedIndex &&
         near(previous->position_fraction, 1.0) &&
         rig.progress->active_session() == std::optional<std::string>("102") &&
         rig.session->status().active_unit_key == "102" &&
         rig.window->active_index() == 1;
}

bool test_scrolling_back_does_not_complete(TestContext& ctx) {
  ReaderRig rig(ctx, 2);
  rig.open(102);
  if(!wait_for_condition([&]{ return rig.window->section_count() == 2 &&
                                     near(rig.session->offset(), 410.0); }, 2s)) {
    return false;
  }
  rig.session->on_scroll(0.0f);
  rig.session->on_settle();
  rig.progress->drain();
  auto left = rig.progress->get_progress("102");
  return (!left || !left->is_complete) &&
         rig.session->status().active_unit_key == "101";
}

bool test_scroll_throttle_tracks_progress(TestContext& ctx) {
  ReaderRig rig(ctx, 1);
  rig.open(101);
  rig.session->on_scroll(50.0f);
  rig.session->on_scroll(100.0f);
  rig.session->on_scroll(210.0f);
  rig.session->on_settle();
  rig.session->close();
  rig.progress->drain();
  auto record = rig.progress->get_progress("101");
  // bottom of the last page, centre 310px into a 410px chapter
  return record && record->is_complete && record->last_index == 3 &&
         near(record->position_fraction, 310.0 / 410.0) &&
         !rig.progress->active_session();
}

bool test_read_once_bottom_passes_threshold(TestContext& ctx) {
  ReaderRig rig(ctx, 1);
  rig.open(101);
  // viewport bottom at 380 of 410px
  rig.session->on_scroll(180.0f);
  rig.session->on_settle();
  rig.progress->flush_now();
  rig.progress->drain();
  auto short_of_end = rig.progress->get_progress("101");

  // 390 of 410px
  rig.session->on_scroll(190.0f);
  rig.session->on_settle();
  rig.session->close();
  rig.progress->drain();
  auto read = rig.progress->get_progress("101");
  return short_of_end && !short_of_end->is_complete &&
         read && read->is_complete && near(read->position_fraction, 290.0 / 410.0);
}

bool test_page_sizes_and_viewport(TestContext& ctx) {
  ReaderRig rig(ctx, 1);
  rig.open(101);
  bool first = rig.session->report_page_size(0, 0, 800, 1200);
  bool second = rig.session->report_page_size(0, 0, 800, 1600);
  auto height = rig.window->cached_page_height(0, 0);
  bool invalid = !rig.session->report_page_size(0, 1, 0, 1200);

  rig.session->set_viewport(100.0f, 300.0f);
  bool kept = rig.window->cached_page_height(0, 0).has_value();
  rig.session->set_viewport(200.0f, 300.0f);
  bool dropped = !rig.window->cached_page_height(0, 0).has_value();
  return first && !second && height && near(*height, 150.0) && invalid &&
         kept && dropped && near(rig.session->metrics().viewport_width, 200.0);
}

bool test_layout_math(TestContext&) {
  auto m = test_metrics();
  WindowSection a;
  a.unit = make_unit(101, 1);
  a.items = make_pages(101, 4);
  WindowSection b = a;
  b.unit = make_unit(102, 2);
  b.sub_item_heights[0] = 250.0f;
  std::vector<WindowSection> strip = {a, b};

  auto top = layout::position_at_center(strip, 0.0f, m);
  auto header = layout::position_at_center(strip, 315.0f, m);
  auto second = layout::position_at_center(strip, 420.0f, m);
  auto past_end = layout::position_at_center(strip, 5000.0f, m);

  return near(layout::section_height(a, m), 410.0) &&
         near(layout::section_height(b, m), 560.0) &&
         near(layout::section_start(strip, 1, m), 410.0) &&
         near(layout::content_height(strip, m), 970.0) &&
         top && top->section == 0 && top->item == 0 &&
         header && header->section == 1 && header->item == -1 &&
         second && second->section == 1 && second->item == 0 &&
         past_end && past_end->section == 1 && past_end->item == 3 &&
         !layout::position_at_center({}, 0.0f, m) &&
         near(layout::section_scroll_fraction(strip, 0, 105.0f, m), 205.0 / 410.0) &&
         near(layout::section_scroll_fraction(strip, 1, 0.0f, m), 0.0) &&
         near(layout::overall_fraction(385.0f, 970.0f, 200.0f), 0.5) &&
         near(layout::overall_fraction(10.0f, 150.0f, 200.0f), 0.0) &&
         near(layout::offset_after_prepend(40.0f, 410.0f), 450.0) &&
         near(layout::clamp_offset(-5.0f, 970.0f, 200.0f), 0.0) &&
         near(layout::clamp_offset(5000.0f, 970.0f, 200.0f), 770.0) &&
         near(layout::fitted_height(800, 1200, 100.0f), 150.0) &&
         near(layout::fitted_height(0, 1200, 100.0f), 0.0) &&
         near(layout::offset_from_percentage(0.5, 1000.0f, 200.0f), 400.0) &&
         near(layout::percentage_from_offset(400.0f, 1000.0f, 200.0f), 0.5) &&
         near(layout::percentage_from_page(5, 11), 0.5) &&
         layout::page_from_percentage(0.5, 11) == 5 &&
         layout::page_from_percentage(0.9, 1) == 0;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"window_stays_within_radius", test_window_stays_within_radius},
    {"out_of_range_update_ignored", test_out_of_range_update_ignored},
    {"heights_survive_unload", test_heights_survive_unload},
    {"first_height_wins", test_first_height_wins},
    {"unload_purges_images", test_unload_purges_images},
    {"debounce_coalesces", test_debounce_coalesces},
    {"invalidate_cancels_debounce", test_invalidate_cancels_debounce},
    {"prepend_shifts_active_index", test_prepend_shifts_active_index},
    {"section_events", test_section_events},
    {"load_state_transitions", test_load_state_transitions},
    {"reset_clears_window", test_reset_clears_window},
    {"prefetch_boundary_and_failure", test_prefetch_boundary_and_failure},
    {"prefetch_cancel_drops_late_result", test_prefetch_cancel_drops_late_result},
    {"prefetch_timeout", test_prefetch_timeout},
    {"session_resumes_at_fraction", test_session_resumes_at_fraction},
    {"prepend_keeps_reading_position", test_prepend_keeps_reading_position},
    {"prepend_while_settling", test_prepend_while_settling},
    {"leaving_chapter_marks_it_complete", test_leaving_chapter_marks_it_complete},
    {"scrolling_back_does_not_complete", test_scrolling_back_does_not_complete},
    {"scroll_throttle_tracks_progress", test_scroll_throttle_tracks_progress},
    {"read_once_bottom_passes_threshold", test_read_once_bottom_passes_threshold},
    {"page_sizes_and_viewport", test_page_sizes_and_viewport},
    {"layout_math", test_layout_math},
  };
  return scrollkeeper::test::run_test_cases("window", tests, argc, argv);
}
