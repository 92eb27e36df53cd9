#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "log.hpp"
#include "progress_engine.hpp"

class CatalogContentSource;
class ContentSource;
class DurableStore;
class ImageMemoryCache;
class ReaderCLI;
class ReaderSession;
class SettingsManager;

class ReaderEngine {
public:
  struct Options {
    bool start_cli_thread = false;
    std::filesystem::path workspace_root = std::filesystem::current_path();
    // Leave empty to pick the store from the store_path setting.
    std::shared_ptr<DurableStore> store;
    std::shared_ptr<RemoteSync> remote;
    ProgressReconciliationEngine::Clock clock;
  };

  ReaderEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~ReaderEngine();

  void start();
  void run();
  void start_background();
  void stop();
  // Ends run() from any thread, including the CLI thread.
  void request_stop();

  void execute_command(const std::string& line);

  // Builds a window, prefetcher and session from the current settings. The
  // previous session, if any, is closed first.
  std::shared_ptr<ReaderSession> open_reader(std::shared_ptr<ContentSource> source = nullptr);
  std::shared_ptr<ReaderSession> current_session() const;
  void close_reader();

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<ProgressReconciliationEngine> progress() const { return progress_; }
  std::shared_ptr<CatalogContentSource> catalog() const { return catalog_; }

  struct Stats {
    ProgressReconciliationEngine::Stats progress;
    std::size_t sections = 0;
    std::size_t loaded_sections = 0;
    std::size_t cached_images = 0;
    std::size_t cached_image_bytes = 0;
  };

  Stats stats() const;

  std::filesystem::path store_path() const;

private:
  std::filesystem::path resolve_path(const std::string& value) const;
  void ensure_workspace() const;

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread io_thread_;
  std::shared_ptr<DurableStore> store_;
  std::shared_ptr<ProgressReconciliationEngine> progress_;
  std::shared_ptr<CatalogContentSource> catalog_;
  std::shared_ptr<ImageMemoryCache> image_cache_;
  std::unique_ptr<ReaderCLI> cli_;

  mutable std::mutex session_mutex_;
  std::shared_ptr<ReaderSession> session_;

  bool started_ = false;
  bool cli_thread_running_ = false;
};
