#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace {

struct ConsoleLoggers {
  std::shared_ptr<spdlog::logger> decorated_out;
  std::shared_ptr<spdlog::logger> decorated_err;
  std::shared_ptr<spdlog::logger> plain_out;
  std::shared_ptr<spdlog::logger> plain_err;
};

std::once_flag g_console_once;
ConsoleLoggers g_console;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_console(const std::string& name,
                                             spdlog::sink_ptr sink,
                                             const std::string& pattern,
                                             spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  return logger;
}

const ConsoleLoggers& console() {
  std::call_once(g_console_once, [](){
    const std::string stamped = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    g_console.decorated_out = make_console("netcopy.out",
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), stamped, spdlog::level::warn);
    g_console.decorated_err = make_console("netcopy.err",
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), stamped, spdlog::level::err);
    g_console.plain_out = make_console("netcopy.print",
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), "%v", spdlog::level::info);
    g_console.plain_err = make_console("netcopy.print_err",
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), "%v", spdlog::level::err);
  });
  return g_console;
}

spdlog::logger* console_for(LogChannel channel) {
  const auto& loggers = console();
  switch(channel) {
    case LogChannel::Print:    return loggers.plain_out.get();
    case LogChannel::PrintErr: return loggers.plain_err.get();
    case LogChannel::Error:    return loggers.decorated_err.get();
    default:                   return loggers.decorated_out.get();
  }
}

} // namespace

void init(bool verbose) {
  const auto& loggers = console();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  loggers.decorated_out->set_level(level);
  loggers.decorated_err->set_level(spdlog::level::info);
  loggers.plain_out->set_level(spdlog::level::info);
  loggers.plain_err->set_level(spdlog::level::info);
  spdlog::set_level(level);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

const char* channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info:     return "info";
    case LogChannel::Warn:     return "warn";
    case LogChannel::Error:    return "error";
    case LogChannel::Debug:    return "debug";
    case LogChannel::Print:    return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

std::string Logger::name() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return name_;
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(handle);
}

void Logger::emit(LogChannel channel, const std::string& message) {
  auto level = detail::level_for(channel);
  std::string prefix = name();
  std::string channel_label = prefix.empty()
    ? std::string(channel_name(channel))
    : prefix + ":" + channel_name(channel);
  if(dispatch(channel_label, level, message)) return;
  // Plain output stays plain; the logger name only decorates log lines.
  bool plain = channel == LogChannel::Print || channel == LogChannel::PrintErr;
  detail::emit_to_console(channel, plain ? std::string() : prefix, message);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_console(LogChannel::Error, "log",
                              std::string("listener threw: ") + e.what());
    }
  }
  return handled;
}

namespace detail {

spdlog::level::level_enum level_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Warn:     return spdlog::level::warn;
    case LogChannel::Error:    return spdlog::level::err;
    case LogChannel::Debug:    return spdlog::level::debug;
    case LogChannel::PrintErr: return spdlog::level::err;
    default:                   return spdlog::level::info;
  }
}

void emit_to_console(LogChannel channel,
                     const std::string& prefix,
                     const std::string& message) {
  if(!log_passthrough()) return;
  auto* sink = console_for(channel);
  if(!sink) return;
  auto level = level_for(channel);
  if(prefix.empty()) {
    sink->log(level, message);
  } else {
    sink->log(level, fmt::format("[{}] {}", prefix, message));
  }
}

} // namespace detail
