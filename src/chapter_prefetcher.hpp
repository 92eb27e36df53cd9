#pragma once
#include <asio.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "content_source.hpp"
#include "log.hpp"
#include "windowed_content_manager.hpp"

struct PrefetchOutcome {
  Direction direction = Direction::Forward;
  FetchResult::Status status = FetchResult::Status::Failed;
  UnitId unit_id = 0;                       // fetched chapter when Found
  std::optional<std::size_t> section_index; // where it landed in the window
  bool inserted = false;                    // false when it was already there
  bool timed_out = false;
  std::string error;
};

// Grows the window one chapter at a time in either direction. Fetches run on
// a small worker pool; results are applied on the io_context. A boundary is
// terminal for its direction, a failure only blocks retries for retry_after.
class ChapterPrefetcher : public std::enable_shared_from_this<ChapterPrefetcher> {
public:
  struct Options {
    std::chrono::milliseconds timeout{15000};
    std::chrono::milliseconds retry_after{2000};
  };

  using CompletionCallback = std::function<void(const PrefetchOutcome&)>;

  ChapterPrefetcher(asio::io_context& io,
                    std::shared_ptr<WindowedContentManager> window,
                    std::shared_ptr<ContentSource> source,
                    Options options,
                    std::shared_ptr<Logger> logger = nullptr);
  ~ChapterPrefetcher();

  ChapterPrefetcher(const ChapterPrefetcher&) = delete;
  ChapterPrefetcher& operator=(const ChapterPrefetcher&) = delete;

  void set_completion_callback(CompletionCallback cb);

  // Starts a fetch next to the window's edge. Returns false when one is
  // already running, the end was reached, a failure is still cooling down or
  // the window is empty.
  bool request(Direction direction);

  // Drops in-flight fetches; their results are discarded when they arrive.
  void cancel();
  // Forget boundaries and failures, e.g. after opening another series.
  void reset();

  bool in_flight(Direction direction) const;
  bool reached_end(Direction direction) const;
  std::optional<std::string> last_failure(Direction direction) const;

private:
  struct Slot {
    explicit Slot(asio::io_context& io) : timer(io) {}
    asio::steady_timer timer;
    uint64_t generation = 0;
    bool fetching = false;
    bool reached_end = false;
    std::optional<std::string> failure;
    std::chrono::steady_clock::time_point failed_at{};
  };

  Slot& slot(Direction direction) { return direction == Direction::Forward ? forward_ : backward_; }
  const Slot& slot(Direction direction) const { return direction == Direction::Forward ? forward_ : backward_; }

  void finish(Direction direction, uint64_t generation, FetchResult result);
  void on_timeout(Direction direction, uint64_t generation);
  void notify(const PrefetchOutcome& outcome);

  asio::io_context& io_;
  std::shared_ptr<WindowedContentManager> window_;
  std::shared_ptr<ContentSource> source_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  Slot forward_;
  Slot backward_;
  uint64_t next_generation_ = 0;

  std::mutex callback_mutex_;
  CompletionCallback completion_;

  asio::thread_pool fetch_pool_{2};
};
