#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

struct LogOptions {
  bool verbose = false;
  std::string level;      // "trace".."off"; overrides verbose when set
  std::string file_path;  // mirror everything to this file when non-empty
};

void init(bool verbose = false);
void init(const LogOptions& options);
void set_log_passthrough(bool enabled);
bool log_passthrough();
spdlog::level::level_enum parse_log_level(const std::string& name,
                                          spdlog::level::level_enum fallback);

// Diagnostics go to the stamped sinks; Print/PrintErr are command output and
// are written bare.
enum class LogChannel { Debug, Info, Warn, Error, Print, PrintErr };

const char* to_string(LogChannel channel);
spdlog::level::level_enum level_of(LogChannel channel);

// False when passthrough is off or the channel's sink filters the level out.
bool sink_accepts(LogChannel channel);
// Sends a formatted line to the process sinks, honouring passthrough.
void emit_to_sinks(LogChannel channel, const std::string& source, const std::string& message);

using LogListenerHandle = std::size_t;

// Named logger. Listeners see every message first, whatever the sink level;
// when none of them claims it the message goes to the shared spdlog sinks.
class Logger {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  explicit Logger(std::string name);

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void write(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    if(!wanted(channel)) return;
    auto message = fmt::format(fmt, std::forward<Args>(args)...);
    if(dispatch(channel, message)) return;
    emit_to_sinks(channel, name_, message);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Info, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Warn, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Error, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Print, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
  }

private:
  // Skips formatting when neither a listener nor a sink would take the line.
  bool wanted(LogChannel channel) const;
  bool dispatch(LogChannel channel, const std::string& message);

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  std::string name_;
  mutable std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<std::size_t> listener_total_{0};
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

// For code that may run without a logger, e.g. before the engine exists.
template<typename... Args>
inline void log_to(Logger* logger,
                   LogChannel channel,
                   spdlog::format_string_t<Args...> fmt,
                   Args&&... args) {
  if(logger) {
    logger->write(channel, fmt, std::forward<Args>(args)...);
    return;
  }
  if(!sink_accepts(channel)) return;
  emit_to_sinks(channel, std::string(), fmt::format(fmt, std::forward<Args>(args)...));
}
