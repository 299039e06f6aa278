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

// Diagnostics (debug..error) go to stderr so that stdout carries only the
// report; print_out/print_err write undecorated lines.
void init(bool verbose = false);
void set_log_passthrough(bool enabled);
void write_console(bool to_stderr, const std::string& message);

using LogListenerHandle = std::size_t;

class Logger {
public:
  // Returning true keeps the line off the default sinks.
  using Listener = std::function<bool(const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  explicit Logger(std::string name);

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

  // Report output: undecorated, on stdout.
  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    auto formatted = fmt::format(fmt, std::forward<Args>(args)...);
    if(dispatch(name_ + ":print", spdlog::level::info, formatted)) return;
    write_console(false, formatted);
  }

private:
  template<typename... Args>
  void log(spdlog::level::level_enum level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    auto formatted = fmt::format(fmt, std::forward<Args>(args)...);
    if(dispatch(name_, level, formatted)) return;
    emit(level, formatted);
  }

  bool dispatch(const std::string& channel, spdlog::level::level_enum level, const std::string& message);
  void emit(spdlog::level::level_enum level, const std::string& message);

  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, Listener> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

// Plain console lines for code that has no Logger (usage text, settings
// and command line errors).
template<typename... Args>
void print_out(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  write_console(false, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  write_console(true, fmt::format(fmt, std::forward<Args>(args)...));
}
