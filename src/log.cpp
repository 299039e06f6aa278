#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <vector>

namespace {

struct DefaultSinks {
  std::shared_ptr<spdlog::logger> diagnostics;
  std::shared_ptr<spdlog::logger> out;
  std::shared_ptr<spdlog::logger> err;
};

DefaultSinks g_sinks;
std::once_flag g_sinks_once;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_sink_logger(const std::string& name,
                                                 spdlog::sink_ptr sink,
                                                 const char* pattern) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  spdlog::register_logger(logger);
  return logger;
}

void create_sinks() {
  g_sinks.diagnostics = make_sink_logger("sharewatch",
    std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), "[%H:%M:%S.%e] [%^%l%$] %v");
  g_sinks.out = make_sink_logger("sharewatch.out",
    std::make_shared<spdlog::sinks::stdout_sink_mt>(), "%v");
  g_sinks.err = make_sink_logger("sharewatch.err",
    std::make_shared<spdlog::sinks::stderr_sink_mt>(), "%v");

  g_sinks.diagnostics->flush_on(spdlog::level::warn);
  g_sinks.out->flush_on(spdlog::level::info);
  g_sinks.err->flush_on(spdlog::level::info);
}

const DefaultSinks& sinks() {
  std::call_once(g_sinks_once, create_sinks);
  return g_sinks;
}

bool passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

void init(bool verbose) {
  const auto& s = sinks();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  s.diagnostics->set_level(level);
  s.out->set_level(spdlog::level::info);
  s.err->set_level(spdlog::level::info);
  spdlog::set_default_logger(s.diagnostics);
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

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

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& listener : snapshot) {
    try {
      if(listener(channel, level, message)) handled = true;
    } catch(const std::exception& e) {
      emit(spdlog::level::err, fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void Logger::emit(spdlog::level::level_enum level, const std::string& message) {
  const auto& s = sinks();
  if(!passthrough()) return;
  s.diagnostics->log(level, fmt::format("[{}] {}", name_, message));
}

void write_console(bool to_stderr, const std::string& message) {
  const auto& s = sinks();
  if(!passthrough()) return;
  (to_stderr ? s.err : s.out)->info(message);
}
