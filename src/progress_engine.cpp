#include "progress_engine.hpp"

#include <future>
#include <stdexcept>

#include "conflict_resolver.hpp"
#include "utils.hpp"

// State shared with jobs on the worker. Jobs never touch the engine itself,
// so the engine can join the worker from its destructor.
struct ProgressReconciliationEngine::Pipeline {
  std::shared_ptr<DurableStore> store;
  std::shared_ptr<RemoteSync> remote;
  std::shared_ptr<Logger> logger;

  std::mutex stats_mutex;
  Stats stats;

  void write(const std::vector<ProgressRecord>& records, bool push_remote);
  void push(const ProgressRecord& record);
  void count(std::size_t Stats::* field) {
    std::lock_guard lg(stats_mutex);
    ++(stats.*field);
  }
};

void ProgressReconciliationEngine::Pipeline::write(const std::vector<ProgressRecord>& records,
                                                   bool push_remote) {
  for(const auto& incoming : records) {
    conflict::Resolution resolution;
    try {
      resolution = conflict::resolve(store->get(incoming.unit_key), incoming);
      if(resolution.outcome == conflict::Outcome::KeptExisting) {
        count(&Stats::stale_ignored);
        logger->debug("chapter {}: stale update ignored", incoming.unit_key);
        continue;
      }
      store->put(resolution.winner);
    } catch(const std::exception& e) {
      count(&Stats::write_failures);
      logger->error("chapter {}: durable write failed: {}", incoming.unit_key, e.what());
      continue;
    }
    count(&Stats::durable_writes);
    logger->debug("chapter {}: {} at {:.3f} (page {}{})",
                  incoming.unit_key,
                  conflict::to_string(resolution.outcome),
                  resolution.winner.position_fraction,
                  resolution.winner.last_index,
                  resolution.winner.is_complete ? ", complete" : "");
    if(push_remote) push(resolution.winner);
  }
}

void ProgressReconciliationEngine::Pipeline::push(const ProgressRecord& record) {
  if(!remote) return;
  std::string error;
  bool ok = false;
  try {
    ok = remote->push_progress(record.unit_key, record.last_index, record.is_complete, error);
  } catch(const std::exception& e) {
    error = e.what();
  }
  if(ok) {
    count(&Stats::remote_pushes);
  } else {
    count(&Stats::remote_failures);
    logger->warn("chapter {}: remote sync failed: {}", record.unit_key, error);
  }
}

ProgressReconciliationEngine::ProgressReconciliationEngine(asio::io_context& io,
                                                           Options options,
                                                           std::shared_ptr<DurableStore> store,
                                                           std::shared_ptr<RemoteSync> remote,
                                                           std::shared_ptr<Logger> logger,
                                                           Clock clock)
  : options_(options),
    clock_(std::move(clock)),
    pipeline_(std::make_shared<Pipeline>()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("progress")),
    debounce_timer_(io) {
  if(!store) {
    throw std::invalid_argument("ProgressReconciliationEngine: null store");
  }
  pipeline_->store = std::move(store);
  pipeline_->remote = std::move(remote);
  pipeline_->logger = logger_;
}

ProgressReconciliationEngine::~ProgressReconciliationEngine() {
  try {
    shutdown();
  } catch(const std::exception& e) {
    logger_->error("shutdown failed: {}", e.what());
  }
}

Timestamp ProgressReconciliationEngine::system_now() {
  return truncate_to_ms(std::chrono::system_clock::now());
}

// Timestamps carry millisecond precision, as stored. The default clock is
// bumped so writes from this engine are strictly ordered even within one
// millisecond; injected clocks are only truncated.
Timestamp ProgressReconciliationEngine::next_timestamp_locked() {
  if(clock_) return truncate_to_ms(clock_());
  auto now = system_now();
  if(now <= last_timestamp_) now = last_timestamp_ + std::chrono::milliseconds(1);
  last_timestamp_ = now;
  return now;
}

void ProgressReconciliationEngine::begin_session(const std::string& unit_key) {
  std::lock_guard lg(m_);
  if(active_session_ && *active_session_ != unit_key) {
    logger_->debug("session {} replaced by {}", *active_session_, unit_key);
  }
  active_session_ = unit_key;
}

void ProgressReconciliationEngine::end_session() {
  std::vector<PendingUpdate> batch;
  {
    std::lock_guard lg(m_);
    active_session_.reset();
    cancel_timer_locked();
    batch = take_pending_locked();
  }
  std::vector<ProgressRecord> records;
  records.reserve(batch.size());
  for(const auto& u : batch) records.push_back(u.to_record());
  submit(std::move(records), true);
}

std::optional<std::string> ProgressReconciliationEngine::active_session() const {
  std::lock_guard lg(m_);
  return active_session_;
}

bool ProgressReconciliationEngine::should_accept_external_update(const std::string& unit_key) const {
  std::lock_guard lg(m_);
  return !active_session_ || *active_session_ != unit_key;
}

void ProgressReconciliationEngine::update_progress(const std::string& unit_key,
                                                   const std::string& series_key,
                                                   double fraction,
                                                   int index,
                                                   bool is_complete) {
  if(unit_key.empty()) {
    logger_->warn("progress update without a chapter key ignored");
    return;
  }
  std::lock_guard lg(m_);
  if(shut_down_) {
    logger_->warn("chapter {}: update after shutdown ignored", unit_key);
    return;
  }
  PendingUpdate update;
  update.unit_key = unit_key;
  update.series_key = series_key;
  update.position_fraction = clamp_fraction(fraction);
  update.index = index < 0 ? 0 : index;
  update.is_complete = is_complete;
  update.timestamp = next_timestamp_locked();
  pending_[unit_key] = std::move(update);
  schedule_flush_locked();
}

void ProgressReconciliationEngine::mark_unit_complete_immediate(const std::string& unit_key,
                                                                const std::string& series_key) {
  ProgressRecord record;
  {
    std::lock_guard lg(m_);
    if(shut_down_) {
      logger_->warn("chapter {}: completion after shutdown ignored", unit_key);
      return;
    }
    pending_.erase(unit_key);
    record.unit_key = unit_key;
    record.series_key = series_key;
    record.position_fraction = 1.0;
    record.is_complete = true;
    record.last_index = kFullyConsumedIndex;
    record.updated_at = next_timestamp_locked();
  }
  logger_->debug("chapter {}: marked complete", unit_key);
  submit({record}, true);
}

bool ProgressReconciliationEngine::apply_external_update(const ProgressRecord& record) {
  {
    std::lock_guard lg(m_);
    if(shut_down_) return false;
    if(active_session_ && *active_session_ == record.unit_key) {
      std::lock_guard slg(pipeline_->stats_mutex);
      ++pipeline_->stats.external_rejected;
      logger_->debug("chapter {}: external update rejected during session", record.unit_key);
      return false;
    }
  }
  auto clamped = record;
  clamped.position_fraction = clamp_fraction(record.position_fraction);
  // the store keeps milliseconds; resolve on what a reload would see
  clamped.updated_at = truncate_to_ms(record.updated_at);
  submit({clamped}, false);
  return true;
}

std::size_t ProgressReconciliationEngine::mark_units_read(const std::vector<std::string>& unit_keys,
                                                          const std::string& series_key,
                                                          bool is_read) {
  std::vector<ProgressRecord> records;
  {
    std::lock_guard lg(m_);
    if(shut_down_) return 0;
    for(const auto& key : unit_keys) {
      if(key.empty()) continue;
      ProgressRecord r;
      r.unit_key = key;
      r.series_key = series_key;
      r.position_fraction = is_read ? 1.0 : 0.0;
      r.is_complete = is_read;
      r.last_index = is_read ? kFullyConsumedIndex : 0;
      r.updated_at = next_timestamp_locked();
      records.push_back(std::move(r));
    }
  }
  auto n = records.size();
  logger_->debug("marking {} chapters {}", n, is_read ? "read" : "unread");
  submit(std::move(records), true);
  return n;
}

std::optional<ProgressRecord> ProgressReconciliationEngine::get_progress(const std::string& unit_key) const {
  return pipeline_->store->get(unit_key);
}

std::map<std::string, bool> ProgressReconciliationEngine::get_read_status(const std::vector<std::string>& unit_keys) const {
  std::map<std::string, bool> out;
  for(const auto& kv : pipeline_->store->get_many(unit_keys)) {
    out.emplace(kv.first, kv.second.is_complete);
  }
  return out;
}

std::size_t ProgressReconciliationEngine::clear_history() {
  auto task = std::make_shared<std::packaged_task<std::size_t()>>(
    [pipeline = pipeline_]{ return pipeline->store->erase_all(); });
  auto result = task->get_future();
  {
    // posting under m_ orders the job before shutdown() can join the worker
    std::lock_guard lg(m_);
    if(shut_down_) {
      throw std::runtime_error("clear_history after shutdown");
    }
    cancel_timer_locked();
    pending_.clear();
    asio::post(worker_, [task]{ (*task)(); });
  }
  auto erased = result.get();
  logger_->info("cleared {} progress records", erased);
  return erased;
}

void ProgressReconciliationEngine::flush_now() {
  std::vector<PendingUpdate> batch;
  {
    std::lock_guard lg(m_);
    cancel_timer_locked();
    batch = take_pending_locked();
  }
  std::vector<ProgressRecord> records;
  records.reserve(batch.size());
  for(const auto& u : batch) records.push_back(u.to_record());
  submit(std::move(records), true);
}

void ProgressReconciliationEngine::drain() {
  auto done = std::make_shared<std::promise<void>>();
  auto finished = done->get_future();
  {
    std::lock_guard lg(m_);
    if(shut_down_) return;
    asio::post(worker_, [done]{ done->set_value(); });
  }
  finished.wait();
}

void ProgressReconciliationEngine::invalidate() {
  flush_now();
}

void ProgressReconciliationEngine::shutdown() {
  std::vector<PendingUpdate> batch;
  {
    std::lock_guard lg(m_);
    if(shut_down_) return;
    shut_down_ = true;
    cancel_timer_locked();
    batch = take_pending_locked();
  }
  std::vector<ProgressRecord> records;
  records.reserve(batch.size());
  for(const auto& u : batch) records.push_back(u.to_record());
  submit(std::move(records), true);
  worker_.join();
}

std::size_t ProgressReconciliationEngine::pending_count() const {
  std::lock_guard lg(m_);
  return pending_.size();
}

ProgressReconciliationEngine::Stats ProgressReconciliationEngine::stats() const {
  std::lock_guard lg(pipeline_->stats_mutex);
  return pipeline_->stats;
}

void ProgressReconciliationEngine::schedule_flush_locked() {
  const uint64_t generation = ++debounce_generation_;
  debounce_timer_.expires_after(options_.debounce);
  std::weak_ptr<ProgressReconciliationEngine> weak = weak_from_this();
  debounce_timer_.async_wait([weak, generation](const std::error_code& ec){
    if(ec) return;
    if(auto self = weak.lock()) {
      self->on_debounce_fired(generation);
    }
  });
}

void ProgressReconciliationEngine::cancel_timer_locked() {
  ++debounce_generation_;
  debounce_timer_.cancel();
}

void ProgressReconciliationEngine::on_debounce_fired(uint64_t generation) {
  {
    std::lock_guard lg(m_);
    if(generation != debounce_generation_) return;
  }
  flush_now();
}

std::vector<PendingUpdate> ProgressReconciliationEngine::take_pending_locked() {
  std::vector<PendingUpdate> out;
  out.reserve(pending_.size());
  for(auto& kv : pending_) out.push_back(std::move(kv.second));
  pending_.clear();
  return out;
}

void ProgressReconciliationEngine::submit(std::vector<ProgressRecord> records, bool push_remote) {
  if(records.empty()) return;
  asio::post(worker_, [pipeline = pipeline_, records = std::move(records), push_remote]{
    pipeline->write(records, push_remote);
  });
}
