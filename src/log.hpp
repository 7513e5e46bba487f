#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Where a line is headed. Log channels carry a timestamp and go to stderr;
// Print goes bare to stdout and PrintErr bare to stderr.
enum class LogChannel {
  Debug,
  Info,
  Warn,
  Error,
  Print,
  PrintErr
};

const char* log_channel_name(LogChannel channel);

// Sets up the console sinks on first use; later calls only change the level.
void init(bool verbose = false);

// When off, nothing reaches the console. Listeners still see every line.
void set_log_passthrough(bool enabled);
bool log_passthrough();

struct LogRecord {
  std::string source;   // Logger name, e.g. "sender"
  LogChannel channel;
  std::string message;
};

using LogListenerHandle = std::size_t;

// A session-scoped log source. Sender and receiver each get one named after
// their role; tests attach listeners to read what a session reported.
class Logger {
public:
  // Returning true swallows the line before it reaches the console.
  using Listener = std::function<bool(const LogRecord&)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

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
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Print, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::PrintErr, fmt::format(fmt, std::forward<Args>(args)...));
  }

private:
  void emit(LogChannel channel, std::string message);

  std::string name_;
  std::mutex listener_mutex_;
  std::vector<std::pair<LogListenerHandle, Listener>> listeners_;
  LogListenerHandle next_handle_ = 1;
};

// Console output for code that runs before any Logger exists.
void write_console(LogChannel channel, const std::string& source, const std::string& message);

template<typename... Args>
void console_print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  write_console(LogChannel::Print, std::string(), fmt::format(fmt, std::forward<Args>(args)...));
}
