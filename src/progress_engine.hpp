#pragma once
#include <asio.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "durable_store.hpp"
#include "log.hpp"
#include "progress_record.hpp"
#include "remote_sync.hpp"

// Coalesces reading-position updates per chapter and writes them to the
// durable store on a single background worker, then pushes each successful
// write to the server. Every write passes the timestamp resolver, so an older
// update never replaces a newer record.
//
// Create through std::make_shared; the debounce timer runs on the supplied
// io_context and only holds a weak reference to the engine.
class ProgressReconciliationEngine
  : public std::enable_shared_from_this<ProgressReconciliationEngine> {
public:
  using Clock = std::function<Timestamp()>;

  struct Options {
    std::chrono::milliseconds debounce{500};
  };

  struct Stats {
    std::size_t durable_writes = 0;
    std::size_t stale_ignored = 0;
    std::size_t write_failures = 0;
    std::size_t remote_pushes = 0;
    std::size_t remote_failures = 0;
    std::size_t external_rejected = 0;
  };

  // remote may be null when syncing is disabled. A null clock uses
  // system_now().
  ProgressReconciliationEngine(asio::io_context& io,
                               Options options,
                               std::shared_ptr<DurableStore> store,
                               std::shared_ptr<RemoteSync> remote = nullptr,
                               std::shared_ptr<Logger> logger = nullptr,
                               Clock clock = nullptr);
  ~ProgressReconciliationEngine();

  ProgressReconciliationEngine(const ProgressReconciliationEngine&) = delete;
  ProgressReconciliationEngine& operator=(const ProgressReconciliationEngine&) = delete;

  void begin_session(const std::string& unit_key);
  // Clears the guard and flushes whatever is pending.
  void end_session();
  std::optional<std::string> active_session() const;
  bool should_accept_external_update(const std::string& unit_key) const;

  void update_progress(const std::string& unit_key,
                       const std::string& series_key,
                       double fraction,
                       int index,
                       bool is_complete);

  // Skips the debounce: drops any pending update for the chapter and queues a
  // completed record at once.
  void mark_unit_complete_immediate(const std::string& unit_key, const std::string& series_key);

  // Writer path for sync and import. Refused while unit_key is being read.
  bool apply_external_update(const ProgressRecord& record);

  // Bulk mark read/unread. Returns the number of writes queued.
  std::size_t mark_units_read(const std::vector<std::string>& unit_keys,
                              const std::string& series_key,
                              bool is_read);

  // Durable values only; a pending update is not visible until flushed.
  std::optional<ProgressRecord> get_progress(const std::string& unit_key) const;
  std::map<std::string, bool> get_read_status(const std::vector<std::string>& unit_keys) const;

  // Discards pending updates and erases every stored record. Blocks until the
  // worker has done it; store errors propagate.
  std::size_t clear_history();

  void flush_now();
  // Blocks until everything queued so far has been processed.
  void drain();
  // Cancels the timer and flushes pending updates.
  void invalidate();
  void shutdown();

  std::size_t pending_count() const;
  Stats stats() const;

  static Timestamp system_now();

private:
  struct Pipeline;

  Timestamp next_timestamp_locked();
  void schedule_flush_locked();
  void cancel_timer_locked();
  void on_debounce_fired(uint64_t generation);
  std::vector<PendingUpdate> take_pending_locked();
  void submit(std::vector<ProgressRecord> records, bool push_remote);

  Options options_;
  Clock clock_;
  std::shared_ptr<Pipeline> pipeline_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  std::unordered_map<std::string, PendingUpdate> pending_;
  std::optional<std::string> active_session_;
  Timestamp last_timestamp_{};
  asio::steady_timer debounce_timer_;
  uint64_t debounce_generation_ = 0;
  bool shut_down_ = false;

  asio::thread_pool worker_{1};
};
