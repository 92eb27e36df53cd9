#pragma once

#include "content_source.hpp"
#include "log.hpp"
#include "progress_record.hpp"
#include "remote_sync.hpp"

#include <spdlog/spdlog.h>

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace scrollkeeper::test {

inline std::filesystem::path prepare_workspace(const std::string& name) {
  auto root = std::filesystem::temp_directory_path() / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root / ".config", ec);
  return root;
}

inline void write_json(const std::filesystem::path& path, const nlohmann::json& content) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::trunc);
  if(out) {
    out << content.dump(2);
  }
}

// Records everything written to the attached loggers, debug included.
class LogCapture {
public:
  struct Entry {
    std::string source;
    spdlog::level::level_enum level;
    std::string text;
  };

  ~LogCapture() { detach_all(); }

  void attach(const std::shared_ptr<Logger>& logger, std::string label = {}) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](void*, const std::string& channel, spdlog::level::level_enum level, const std::string& text) {
        std::lock_guard lg(m_);
        entries_.push_back({label.empty() ? channel : label, level, text});
        return false;
      });
    std::lock_guard lg(m_);
    hooks_.emplace_back(logger, handle);
  }

  void detach_all() {
    decltype(hooks_) hooks;
    {
      std::lock_guard lg(m_);
      hooks.swap(hooks_);
    }
    // listeners lock m_, so remove them unlocked
    for(auto& [logger, handle] : hooks) logger->remove_listener(handle);
  }

  void clear() {
    std::lock_guard lg(m_);
    entries_.clear();
  }

  bool contains(const std::string& needle) const {
    std::lock_guard lg(m_);
    for(const auto& e : entries_) {
      if(e.text.find(needle) != std::string::npos) return true;
    }
    return false;
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard lg(m_);
    std::vector<std::string> lines;
    for(const auto& e : entries_) {
      lines.push_back(fmt::format("{} [{}] {}", e.source, spdlog::level::to_string_view(e.level), e.text));
    }
    return lines;
  }

private:
  mutable std::mutex m_;
  std::vector<Entry> entries_;
  std::vector<std::pair<std::shared_ptr<Logger>, LogListenerHandle>> hooks_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(10)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

// io_context running on its own thread for timer-driven components.
class IoThread {
public:
  IoThread() : work_(asio::make_work_guard(io_)), thread_([this]{ io_.run(); }) {}

  ~IoThread() {
    stop();
  }

  void stop() {
    work_.reset();
    io_.stop();
    if(thread_.joinable()) thread_.join();
  }

  asio::io_context& io() { return io_; }

  // Runs fn on the io thread and waits for it, so earlier handlers are done.
  void sync(std::function<void()> fn = {}) {
    std::promise<void> done;
    auto finished = done.get_future();
    asio::post(io_, [&]{
      if(fn) fn();
      done.set_value();
    });
    finished.wait();
  }

private:
  asio::io_context io_;
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  std::thread thread_;
};

class ManualClock {
public:
  explicit ManualClock(int64_t start_ms = 1'700'000'000'000) : now_ms_(start_ms) {}

  Timestamp now() const { return Timestamp(std::chrono::milliseconds(now_ms_.load())); }
  void advance(std::chrono::milliseconds by) { now_ms_ += by.count(); }
  void set(int64_t ms) { now_ms_ = ms; }

  std::function<Timestamp()> fn() {
    return [this]{ return now(); };
  }

private:
  std::atomic<int64_t> now_ms_;
};

// Remote that records pushes and fails on demand.
class ScriptedRemoteSync : public RemoteSync {
public:
  struct Push {
    std::string unit_key;
    int index = 0;
    bool is_complete = false;
  };

  explicit ScriptedRemoteSync(bool fail = false, bool throw_on_push = false)
    : fail_(fail), throw_(throw_on_push) {}

  bool push_progress(const std::string& unit_key,
                     int index,
                     bool is_complete,
                     std::string& error) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      pushes_.push_back({unit_key, index, is_complete});
    }
    if(throw_) throw std::runtime_error("connection reset");
    if(fail_) {
      error = "server unavailable";
      return false;
    }
    return true;
  }

  std::vector<Push> pushes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pushes_;
  }

private:
  bool fail_;
  bool throw_;
  mutable std::mutex mutex_;
  std::vector<Push> pushes_;
};

inline ContentUnit make_unit(UnitId id, double number, int pages = 4, const std::string& series = "7") {
  ContentUnit unit;
  unit.id = id;
  unit.chapter_number = number;
  unit.display_name = "Chapter " + std::to_string(static_cast<int>(number));
  unit.series_id = series;
  unit.page_count = pages;
  return unit;
}

inline std::vector<SubItem> make_pages(UnitId id, int pages) {
  std::vector<SubItem> items;
  for(int i = 0; i < pages; ++i) {
    SubItem item;
    item.index = i;
    item.url = "/api/v1/manga/7/chapter/" + std::to_string(id) + "/page/" + std::to_string(i);
    items.push_back(std::move(item));
  }
  return items;
}

// Chapters 1..count listed newest first, ids 100 + number.
inline std::shared_ptr<CatalogContentSource> make_catalog(int count, int pages = 4) {
  std::vector<CatalogContentSource::Entry> entries;
  for(int n = count; n >= 1; --n) {
    CatalogContentSource::Entry e;
    e.unit = make_unit(100 + n, n, pages);
    e.items = make_pages(e.unit.id, pages);
    entries.push_back(std::move(e));
  }
  return std::make_shared<CatalogContentSource>(std::move(entries));
}

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

inline int run_test_cases(const char* suite, const std::vector<TestCase>& tests, int argc, char** argv) {
  bool verbose = (std::getenv("SCROLLKEEPER_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("SCROLLKEEPER_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  init(verbose);
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  LogCapture logs;
  TestContext ctx{logs, verbose};

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

} // namespace scrollkeeper::test
