#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <atomic>
#include <memory>

namespace {

struct ConsoleSinks {
  std::shared_ptr<spdlog::logger> log;       // timestamped, stderr
  std::shared_ptr<spdlog::logger> plain_out; // bare, stdout
  std::shared_ptr<spdlog::logger> plain_err; // bare, stderr
};

std::atomic<bool> g_passthrough{true};

ConsoleSinks& console() {
  static ConsoleSinks sinks = []{
    ConsoleSinks s;
    auto log_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    log_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    auto out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    out_sink->set_pattern("%v");
    auto err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    err_sink->set_pattern("%v");

    s.log = std::make_shared<spdlog::logger>("peerdrop", std::move(log_sink));
    s.plain_out = std::make_shared<spdlog::logger>("peerdrop.out", std::move(out_sink));
    s.plain_err = std::make_shared<spdlog::logger>("peerdrop.err", std::move(err_sink));
    s.log->set_level(spdlog::level::info);
    s.log->flush_on(spdlog::level::warn);
    s.plain_out->flush_on(spdlog::level::info);
    s.plain_err->flush_on(spdlog::level::info);
    return s;
  }();
  return sinks;
}

spdlog::level::level_enum level_of(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error: return spdlog::level::err;
    default: return spdlog::level::info;
  }
}

} // namespace

const char* log_channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return "debug";
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "?";
}

void init(bool verbose) {
  auto& sinks = console();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  sinks.log->set_level(level);
  spdlog::set_default_logger(sinks.log);
  spdlog::set_level(level);
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled);
}

bool log_passthrough() {
  return g_passthrough.load();
}

void write_console(LogChannel channel, const std::string& source, const std::string& message) {
  if(!log_passthrough()) return;
  auto& sinks = console();
  switch(channel) {
    case LogChannel::Print:
      sinks.plain_out->info(message);
      return;
    case LogChannel::PrintErr:
      sinks.plain_err->info(message);
      return;
    default:
      break;
  }
  if(source.empty()) {
    sinks.log->log(level_of(channel), message);
  } else {
    sinks.log->log(level_of(channel), fmt::format("[{}] {}", source, message));
  }
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  auto handle = next_handle_++;
  listeners_.emplace_back(handle, std::move(listener));
  return handle;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [handle](const auto& entry){ return entry.first == handle; }),
                   listeners_.end());
}

void Logger::emit(LogChannel channel, std::string message) {
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    for(const auto& entry : listeners_) listeners.push_back(entry.second);
  }
  LogRecord record{name_, channel, std::move(message)};
  bool swallowed = false;
  for(auto& listener : listeners) {
    if(listener(record)) swallowed = true;
  }
  if(!swallowed) {
    write_console(channel, name_, record.message);
  }
}
