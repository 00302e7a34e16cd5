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

// Installs the console sinks (and a rotating file sink when log_file is set).
// Safe to call more than once; later calls only adjust levels and sinks.
void init(bool verbose = false, const std::string& log_file = std::string());
void set_log_passthrough(bool enabled);
bool log_passthrough();

// print/print_err are undecorated user-facing output; the rest are log lines.
enum class LogChannel { Debug, Info, Warn, Error, Print, PrintErr };

const char* to_string(LogChannel channel);
spdlog::level::level_enum level_of(LogChannel channel);

struct LogRecord {
  LogChannel channel = LogChannel::Info;
  std::string source; // logger name, "uploader/file-3"
  std::string message;
};

using LogListenerHandle = std::size_t;

class Logger {
public:
  // Returning true marks the record handled and keeps it off the console.
  using Listener = std::function<bool(const LogRecord& record)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  const std::string& name() const { return name_; }

  // Fresh logger named "<name>/<suffix>". Call forward_to to share listeners.
  std::shared_ptr<Logger> child(const std::string& suffix) const;

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  // Records that reach this logger are also offered to parent's listeners.
  void forward_to(std::shared_ptr<Logger> parent);

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Warn, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Error, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Print, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::PrintErr, fmt::format(fmt, std::forward<Args>(args)...));
  }

  void write(LogChannel channel, std::string message);

private:
  bool offer(const LogRecord& record);

  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, Listener> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
  std::shared_ptr<Logger> parent_;
};

// Straight to the console sinks, no listeners involved.
void emit_record(const LogRecord& record);

// Logs through `logger` when there is one, otherwise straight to the console.
template<typename... Args>
inline void log_to(Logger* logger,
                   LogChannel channel,
                   spdlog::format_string_t<Args...> fmt,
                   Args&&... args) {
  auto message = fmt::format(fmt, std::forward<Args>(args)...);
  if(logger) {
    logger->write(channel, std::move(message));
  } else {
    emit_record(LogRecord{channel, std::string(), std::move(message)});
  }
}

template<typename... Args>
inline void print_out(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  log_to(logger, LogChannel::Print, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  log_to(logger, LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
}
