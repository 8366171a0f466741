#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Console setup shared by the three programs. Safe to call more than once;
// later calls only change the level.
void init(bool verbose = false);

// When false, nothing reaches the console sinks (listeners still fire).
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

enum class LogChannel { Info, Warn, Error, Debug, Print, PrintErr };

const char* channel_name(LogChannel channel);

class Logger {
public:
  // Returning true marks the message as handled; it is then not echoed to
  // the console.
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger() = default;
  explicit Logger(std::string name);

  std::string name() const;

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Warn, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Error, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

  // Undecorated line on stdout. Verdicts go through here.
  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Print, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::PrintErr, fmt::format(fmt, std::forward<Args>(args)...));
  }

private:
  void emit(LogChannel channel, const std::string& message);
  bool dispatch(const std::string& channel,
                spdlog::level::level_enum level,
                const std::string& message);

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  mutable std::mutex mutex_;
  std::string name_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
spdlog::level::level_enum level_for(LogChannel channel);
void emit_to_console(LogChannel channel,
                     const std::string& prefix,
                     const std::string& message);
} // namespace detail

// Free helpers for code that may or may not have a named logger at hand.
template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) logger->info(fmt, std::forward<Args>(args)...);
  else detail::emit_to_console(LogChannel::Info, {}, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) logger->warn(fmt, std::forward<Args>(args)...);
  else detail::emit_to_console(LogChannel::Warn, {}, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) logger->debug(fmt, std::forward<Args>(args)...);
  else detail::emit_to_console(LogChannel::Debug, {}, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) logger->print(fmt, std::forward<Args>(args)...);
  else detail::emit_to_console(LogChannel::Print, {}, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) logger->print_err(fmt, std::forward<Args>(args)...);
  else detail::emit_to_console(LogChannel::PrintErr, {}, fmt::format(fmt, std::forward<Args>(args)...));
}
