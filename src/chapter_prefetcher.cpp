#include "chapter_prefetcher.hpp"

#include <stdexcept>

ChapterPrefetcher::ChapterPrefetcher(asio::io_context& io,
                                     std::shared_ptr<WindowedContentManager> window,
                                     std::shared_ptr<ContentSource> source,
                                     Options options,
                                     std::shared_ptr<Logger> logger)
  : io_(io),
    window_(std::move(window)),
    source_(std::move(source)),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("prefetch")),
    forward_(io),
    backward_(io) {
  if(!window_ || !source_) {
    throw std::invalid_argument("ChapterPrefetcher: window and source are required");
  }
}

ChapterPrefetcher::~ChapterPrefetcher() {
  cancel();
  fetch_pool_.join();
}

void ChapterPrefetcher::set_completion_callback(CompletionCallback cb) {
  std::lock_guard lg(callback_mutex_);
  completion_ = std::move(cb);
}

bool ChapterPrefetcher::request(Direction direction) {
  const auto count = window_->section_count();
  if(count == 0) return false;
  auto edge = window_->section(direction == Direction::Forward ? count - 1 : 0);
  if(!edge) return false;
  const UnitId anchor = edge->unit.id;

  uint64_t generation = 0;
  {
    std::lock_guard lg(m_);
    auto& s = slot(direction);
    if(s.fetching || s.reached_end) return false;
    if(s.failure && std::chrono::steady_clock::now() - s.failed_at < options_.retry_after) {
      return false;
    }
    generation = ++next_generation_;
    s.generation = generation;
    s.fetching = true;
    s.failure.reset();

    std::weak_ptr<ChapterPrefetcher> weak = weak_from_this();
    s.timer.expires_after(options_.timeout);
    s.timer.async_wait([weak, direction, generation](const std::error_code& ec){
      if(ec) return;
      if(auto self = weak.lock()) {
        self->on_timeout(direction, generation);
      }
    });
  }

  logger_->debug("fetching {} of chapter {}", to_string(direction), anchor);
  std::weak_ptr<ChapterPrefetcher> weak = weak_from_this();
  asio::post(fetch_pool_, [weak, source = source_, &io = io_, anchor, direction, generation]{
    FetchResult result;
    try {
      result = source->fetch_adjacent(anchor, direction);
    } catch(const std::exception& e) {
      result = FetchResult::failed(e.what());
    }
    asio::post(io, [weak, direction, generation, result = std::move(result)]() mutable {
      if(auto self = weak.lock()) {
        self->finish(direction, generation, std::move(result));
      }
    });
  });
  return true;
}

void ChapterPrefetcher::finish(Direction direction, uint64_t generation, FetchResult result) {
  PrefetchOutcome outcome;
  outcome.direction = direction;
  outcome.status = result.status;
  {
    std::lock_guard lg(m_);
    auto& s = slot(direction);
    if(!s.fetching || s.generation != generation) {
      logger_->debug("dropping stale {} fetch result", to_string(direction));
      return;
    }
    s.fetching = false;
    s.timer.cancel();
    switch(result.status) {
      case FetchResult::Status::Boundary:
        s.reached_end = true;
        break;
      case FetchResult::Status::Failed:
        s.failure = result.error.empty() ? std::string("fetch failed") : result.error;
        s.failed_at = std::chrono::steady_clock::now();
        outcome.error = *s.failure;
        break;
      case FetchResult::Status::Found:
        break;
    }
  }

  if(result.status == FetchResult::Status::Boundary) {
    logger_->info("no {} chapter available", direction == Direction::Forward ? "next" : "previous");
  } else if(result.status == FetchResult::Status::Failed) {
    logger_->warn("{} fetch failed: {}", to_string(direction), outcome.error);
  } else {
    outcome.unit_id = result.unit.id;
    if(auto existing = window_->index_of(result.unit.id)) {
      logger_->debug("chapter {} already in the window", result.unit.id);
      outcome.section_index = existing;
    } else if(direction == Direction::Forward) {
      outcome.section_index = window_->append_unit(result.unit, std::move(result.items));
      outcome.inserted = true;
    } else {
      window_->prepend_unit(result.unit, std::move(result.items));
      outcome.section_index = 0;
      outcome.inserted = true;
    }
  }
  notify(outcome);
}

void ChapterPrefetcher::on_timeout(Direction direction, uint64_t generation) {
  PrefetchOutcome outcome;
  outcome.direction = direction;
  outcome.status = FetchResult::Status::Failed;
  outcome.timed_out = true;
  {
    std::lock_guard lg(m_);
    auto& s = slot(direction);
    if(!s.fetching || s.generation != generation) return;
    s.fetching = false;
    s.failure = "timed out after " + std::to_string(options_.timeout.count()) + " ms";
    s.failed_at = std::chrono::steady_clock::now();
    outcome.error = *s.failure;
  }
  logger_->warn("{} fetch {}", to_string(direction), outcome.error);
  notify(outcome);
}

void ChapterPrefetcher::cancel() {
  std::lock_guard lg(m_);
  for(auto* s : {&forward_, &backward_}) {
    if(s->fetching) {
      s->fetching = false;
      s->generation = ++next_generation_;
    }
    s->timer.cancel();
  }
}

void ChapterPrefetcher::reset() {
  cancel();
  std::lock_guard lg(m_);
  for(auto* s : {&forward_, &backward_}) {
    s->reached_end = false;
    s->failure.reset();
  }
}

bool ChapterPrefetcher::in_flight(Direction direction) const {
  std::lock_guard lg(m_);
  return slot(direction).fetching;
}

bool ChapterPrefetcher::reached_end(Direction direction) const {
  std::lock_guard lg(m_);
  return slot(direction).reached_end;
}

std::optional<std::string> ChapterPrefetcher::last_failure(Direction direction) const {
  std::lock_guard lg(m_);
  return slot(direction).failure;
}

void ChapterPrefetcher::notify(const PrefetchOutcome& outcome) {
  CompletionCallback cb;
  {
    std::lock_guard lg(callback_mutex_);
    cb = completion_;
  }
  if(cb) cb(outcome);
}
