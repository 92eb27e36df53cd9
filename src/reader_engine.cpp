#include "reader_engine.hpp"

#include <stdexcept>

#include "chapter_prefetcher.hpp"
#include "content_source.hpp"
#include "durable_store.hpp"
#include "image_memory_cache.hpp"
#include "reader_cli.hpp"
#include "reader_session.hpp"
#include "remote_sync.hpp"
#include "settings_manager.hpp"
#include "windowed_content_manager.hpp"

namespace {

constexpr std::chrono::milliseconds kPrefetchRetryAfter{2000};

} // namespace

ReaderEngine::ReaderEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("reader")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

ReaderEngine::~ReaderEngine() {
  stop();
}

void ReaderEngine::ensure_workspace() const {
  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root / ".config", ec);
}

std::filesystem::path ReaderEngine::resolve_path(const std::string& value) const {
  std::filesystem::path p(value);
  if(p.is_relative()) p = options_.workspace_root / p;
  return p;
}

std::filesystem::path ReaderEngine::store_path() const {
  auto configured = settings_->get<std::string>("store_path");
  if(configured.empty()) return options_.workspace_root / ".config" / "progress.json";
  return resolve_path(configured);
}

void ReaderEngine::start() {
  if(started_) return;
  started_ = true;

  ensure_workspace();

  LogOptions log_options;
  log_options.verbose = settings_->get<bool>("verbose");
  log_options.level = settings_->get<std::string>("log_level");
  auto log_file = settings_->get<std::string>("log_file");
  if(!log_file.empty()) log_options.file_path = resolve_path(log_file).string();
  init(log_options);

  work_.emplace(asio::make_work_guard(io_));

  store_ = options_.store;
  if(!store_) {
    auto path = store_path();
    logger_->info("Progress store {}", path.string());
    store_ = std::make_shared<JsonProgressStore>(path, logger_);
  }

  auto remote = options_.remote;
  const auto server_url = settings_->get<std::string>("server_url");
  if(!remote && settings_->get<bool>("remote_sync")) {
    remote = std::make_shared<LoggingRemoteSync>(server_url, logger_);
  }

  ProgressReconciliationEngine::Options progress_options;
  progress_options.debounce = settings_->duration_ms("progress_debounce_ms");
  progress_ = std::make_shared<ProgressReconciliationEngine>(io_,
                                                             progress_options,
                                                             store_,
                                                             remote,
                                                             logger_,
                                                             options_.clock);

  image_cache_ = std::make_shared<ImageMemoryCache>();

  auto catalog_path = settings_->get<std::string>("catalog_path");
  if(catalog_path.empty()) {
    catalog_ = std::make_shared<CatalogContentSource>();
  } else {
    try {
      catalog_ = CatalogContentSource::load_from_file(resolve_path(catalog_path));
      logger_->info("Loaded {} chapters from {}", catalog_->units().size(), catalog_path);
    } catch(const std::exception& e) {
      logger_->error("Catalog unavailable: {}", e.what());
      catalog_ = std::make_shared<CatalogContentSource>();
    }
  }

  cli_ = std::make_unique<ReaderCLI>(*this);
  if(options_.start_cli_thread) {
    cli_->start();
    cli_thread_running_ = true;
  }
}

void ReaderEngine::run() {
  if(!started_) start();
  io_.run();
}

void ReaderEngine::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void ReaderEngine::request_stop() {
  if(work_) work_->reset();
  io_.stop();
}

void ReaderEngine::stop() {
  if(!started_) return;
  started_ = false;

  if(cli_) {
    cli_->stop();
    cli_thread_running_ = false;
  }

  close_reader();
  if(progress_) {
    progress_->shutdown();
  }

  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  io_.restart();
}

std::shared_ptr<ReaderSession> ReaderEngine::open_reader(std::shared_ptr<ContentSource> source) {
  if(!started_) {
    throw std::runtime_error("ReaderEngine::open_reader before start");
  }
  close_reader();
  if(!source) source = catalog_;

  WindowedContentManager::Options window_options;
  window_options.window_radius = static_cast<std::size_t>(settings_->get<int>("window_radius"));
  window_options.debounce = settings_->duration_ms("window_debounce_ms");
  window_options.server_url = settings_->get<std::string>("server_url");
  auto window = std::make_shared<WindowedContentManager>(io_, window_options, image_cache_, logger_);
  window->set_section_callback([logger = logger_](std::size_t index, SectionEvent event){
    logger->debug("section {} {}", index, to_string(event));
  });

  ChapterPrefetcher::Options prefetch_options;
  prefetch_options.timeout = settings_->duration_ms("prefetch_timeout_ms");
  prefetch_options.retry_after = kPrefetchRetryAfter;
  auto prefetcher = std::make_shared<ChapterPrefetcher>(io_, window, std::move(source), prefetch_options, logger_);

  ReaderSession::Options session_options;
  session_options.metrics.viewport_width = static_cast<float>(settings_->get<double>("viewport_width"));
  session_options.metrics.viewport_height = static_cast<float>(settings_->get<double>("viewport_height"));
  session_options.metrics.header_height = static_cast<float>(settings_->get<double>("header_height"));
  session_options.metrics.default_page_aspect = static_cast<float>(settings_->get<double>("default_page_aspect"));
  session_options.scroll_throttle = settings_->duration_ms("scroll_throttle_ms");
  session_options.prefetch_threshold_screens = static_cast<float>(settings_->get<double>("prefetch_threshold_screens"));

  auto session = std::make_shared<ReaderSession>(io_, window, progress_, prefetcher, session_options, logger_);
  {
    std::lock_guard lg(session_mutex_);
    session_ = session;
  }
  return session;
}

std::shared_ptr<ReaderSession> ReaderEngine::current_session() const {
  std::lock_guard lg(session_mutex_);
  return session_;
}

void ReaderEngine::close_reader() {
  std::shared_ptr<ReaderSession> session;
  {
    std::lock_guard lg(session_mutex_);
    session.swap(session_);
  }
  if(session) session->close();
}

void ReaderEngine::execute_command(const std::string& line) {
  if(cli_) {
    cli_->execute_command(line);
  }
}

ReaderEngine::Stats ReaderEngine::stats() const {
  Stats s;
  if(progress_) s.progress = progress_->stats();
  if(auto session = current_session()) {
    s.sections = session->window()->section_count();
    s.loaded_sections = session->window()->loaded_count();
  }
  if(image_cache_) {
    s.cached_images = image_cache_->entry_count();
    s.cached_image_bytes = image_cache_->memory_bytes();
  }
  return s;
}
