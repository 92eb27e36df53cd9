#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <vector>

namespace {

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

struct SinkSet {
  std::shared_ptr<spdlog::logger> info;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
};

std::mutex g_sinks_mutex;
SinkSet g_sinks;
std::shared_ptr<spdlog::sinks::basic_file_sink_mt> g_file_sink;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::sink_ptr console,
                                            const std::string& pattern) {
  console->set_pattern(pattern);
  std::vector<spdlog::sink_ptr> sinks{std::move(console)};
  if(g_file_sink) sinks.push_back(g_file_sink);
  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  spdlog::drop(name);
  spdlog::register_logger(logger);
  return logger;
}

// Caller holds g_sinks_mutex.
void rebuild_sinks_locked() {
  g_sinks.info = make_logger("scrollkeeper.info",
                             std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                             kStampedPattern);
  g_sinks.error = make_logger("scrollkeeper.error",
                              std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                              kStampedPattern);
  g_sinks.print = make_logger("scrollkeeper.print",
                              std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                              "%v");
  g_sinks.print_err = make_logger("scrollkeeper.print_err",
                                  std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                  "%v");

  g_sinks.info->flush_on(spdlog::level::warn);
  g_sinks.error->flush_on(spdlog::level::err);
  g_sinks.print->flush_on(spdlog::level::info);
  g_sinks.print_err->flush_on(spdlog::level::err);
}

SinkSet current_sinks() {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  if(!g_sinks.info) rebuild_sinks_locked();
  return g_sinks;
}

spdlog::logger* sink_for(const SinkSet& sinks, LogChannel channel) {
  switch(channel) {
    case LogChannel::Print:    return sinks.print.get();
    case LogChannel::PrintErr: return sinks.print_err.get();
    case LogChannel::Error:    return sinks.error.get();
    default:                   return sinks.info.get();
  }
}

} // namespace

spdlog::level::level_enum parse_log_level(const std::string& name,
                                          spdlog::level::level_enum fallback) {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  if(lowered.empty()) return fallback;
  if(lowered == "warn") lowered = "warning";
  if(lowered == "error") lowered = "err";
  auto level = spdlog::level::from_str(lowered);
  // from_str maps unknown names to off
  if(level == spdlog::level::off && lowered != "off") return fallback;
  return level;
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose) {
  LogOptions options;
  options.verbose = verbose;
  init(options);
}

void init(const LogOptions& options) {
  auto level = parse_log_level(options.level,
                               options.verbose ? spdlog::level::debug : spdlog::level::info);
  SinkSet sinks;
  {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    g_file_sink.reset();
    if(!options.file_path.empty()) {
      try {
        g_file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file_path, false);
        g_file_sink->set_pattern(kStampedPattern);
      } catch(const spdlog::spdlog_ex& e) {
        g_file_sink.reset();
        std::fprintf(stderr, "Unable to open log file %s: %s\n", options.file_path.c_str(), e.what());
      }
    }
    rebuild_sinks_locked();
    sinks = g_sinks;
  }

  sinks.info->set_level(level);
  sinks.error->set_level(spdlog::level::info);
  sinks.print->set_level(spdlog::level::info);
  sinks.print_err->set_level(spdlog::level::info);

  spdlog::set_default_logger(sinks.info);
  spdlog::set_level(level);
}

const char* to_string(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug:    return "debug";
    case LogChannel::Info:     return "info";
    case LogChannel::Warn:     return "warn";
    case LogChannel::Error:    return "error";
    case LogChannel::Print:    return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum level_of(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Warn:  return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr:
      return spdlog::level::err;
    case LogChannel::Info:
    case LogChannel::Print:
      return spdlog::level::info;
  }
  return spdlog::level::info;
}

bool sink_accepts(LogChannel channel) {
  if(!log_passthrough()) return false;
  auto sinks = current_sinks();
  auto* sink = sink_for(sinks, channel);
  return sink && sink->should_log(level_of(channel));
}

void emit_to_sinks(LogChannel channel, const std::string& source, const std::string& message) {
  if(!log_passthrough()) return;
  auto sinks = current_sinks();
  auto* sink = sink_for(sinks, channel);
  if(!sink) return;
  const bool bare = channel == LogChannel::Print || channel == LogChannel::PrintErr;
  if(!bare && !source.empty()) {
    sink->log(level_of(channel), fmt::format("[{}] {}", source, message));
  } else {
    sink->log(level_of(channel), message);
  }
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  listener_total_ = listeners_.size();
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
  listener_total_ = listeners_.size();
}

bool Logger::wanted(LogChannel channel) const {
  return listener_total_.load() > 0 || sink_accepts(channel);
}

bool Logger::dispatch(LogChannel channel, const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if(listeners_.empty()) return false;
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  const std::string channel_name = name_.empty()
    ? std::string(to_string(channel))
    : name_ + ":" + to_string(channel);
  bool handled = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel_name, level_of(channel), message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      emit_to_sinks(LogChannel::Error, "log-listener", fmt::format("listener threw: {}", e.what()));
    }
  }
  return handled;
}
