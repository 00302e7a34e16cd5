#include "log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>
#include <vector>

namespace {
constexpr const char* kLinePattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr std::size_t kLogFileMaxBytes = 8 * 1024 * 1024;
constexpr std::size_t kLogFileCount = 3;

struct Sinks {
  std::shared_ptr<spdlog::logger> out;       // debug, info
  std::shared_ptr<spdlog::logger> err;       // warn, error
  std::shared_ptr<spdlog::logger> plain_out; // print
  std::shared_ptr<spdlog::logger> plain_err; // print_err
  std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file;
};

Sinks g_sinks;
std::mutex g_sinks_mutex;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_console(const char* name, bool to_stderr, const char* pattern) {
  spdlog::sink_ptr sink;
  if(to_stderr) {
    sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  } else {
    sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  }
  sink->set_pattern(pattern);
  return std::make_shared<spdlog::logger>(name, std::move(sink));
}

void create_sinks_locked() {
  if(g_sinks.out) return;
  g_sinks.out = make_console("chunkup", false, kLinePattern);
  g_sinks.err = make_console("chunkup.err", true, kLinePattern);
  g_sinks.plain_out = make_console("chunkup.print", false, "%v");
  g_sinks.plain_err = make_console("chunkup.print_err", true, "%v");

  g_sinks.out->flush_on(spdlog::level::warn);
  g_sinks.err->flush_on(spdlog::level::warn);
  g_sinks.plain_out->flush_on(spdlog::level::info);
  g_sinks.plain_err->flush_on(spdlog::level::info);
}

spdlog::logger* sink_for(LogChannel channel) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  create_sinks_locked();
  switch(channel) {
    case LogChannel::Print: return g_sinks.plain_out.get();
    case LogChannel::PrintErr: return g_sinks.plain_err.get();
    case LogChannel::Warn:
    case LogChannel::Error: return g_sinks.err.get();
    default: return g_sinks.out.get();
  }
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

const char* to_string(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return "debug";
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum level_of(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    default: return spdlog::level::info;
  }
}

void emit_record(const LogRecord& record) {
  if(!log_passthrough()) return;
  auto* sink = sink_for(record.channel);
  const bool plain = record.channel == LogChannel::Print || record.channel == LogChannel::PrintErr;
  if(plain || record.source.empty()) {
    sink->log(level_of(record.channel), record.message);
  } else {
    sink->log(level_of(record.channel), fmt::format("[{}] {}", record.source, record.message));
  }
}

std::shared_ptr<Logger> Logger::child(const std::string& suffix) const {
  return std::make_shared<Logger>(name_.empty() ? suffix : name_ + "/" + suffix);
}

void Logger::forward_to(std::shared_ptr<Logger> parent) {
  parent_ = std::move(parent);
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::write(LogChannel channel, std::string message) {
  LogRecord record{channel, name_, std::move(message)};
  if(!offer(record)) emit_record(record);
}

bool Logger::offer(const LogRecord& record) {
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners.reserve(listeners_.size());
    for(const auto& entry : listeners_) listeners.push_back(entry.second);
  }
  bool handled = false;
  for(auto& listener : listeners) {
    try {
      if(listener(record)) handled = true;
    } catch(const std::exception& e) {
      emit_record(LogRecord{LogChannel::Error, "log-listener",
                            fmt::format("listener failed on '{}': {}", record.source, e.what())});
    }
  }
  if(parent_ && parent_->offer(record)) handled = true;
  return handled;
}

void init(bool verbose, const std::string& log_file) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  create_sinks_locked();
  if(!log_file.empty() && !g_sinks.file) {
    g_sinks.file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      log_file, kLogFileMaxBytes, kLogFileCount);
    g_sinks.file->set_pattern(kLinePattern);
    g_sinks.out->sinks().push_back(g_sinks.file);
    g_sinks.err->sinks().push_back(g_sinks.file);
  }

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_sinks.out->set_level(level);
  g_sinks.err->set_level(spdlog::level::info);
  g_sinks.plain_out->set_level(spdlog::level::info);
  g_sinks.plain_err->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_sinks.out);
  spdlog::set_level(level);
}
