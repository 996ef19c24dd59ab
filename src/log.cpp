#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::once_flag g_create_once;
std::atomic<bool> g_log_passthrough{true};
std::atomic<bool> g_debug_enabled{false};

void create_loggers() {
  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_info_logger = std::make_shared<spdlog::logger>("drop.info", std::move(info_sink));
  g_error_logger = std::make_shared<spdlog::logger>("drop.error", std::move(error_sink));
  g_print_logger = std::make_shared<spdlog::logger>("drop.print", std::move(plain_out_sink));
  g_print_err_logger = std::make_shared<spdlog::logger>("drop.print_err", std::move(plain_err_sink));

  g_info_logger->set_level(spdlog::level::debug);
  g_info_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  std::call_once(g_create_once, create_loggers);
}

spdlog::logger* sink_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Print:    return g_print_logger.get();
    case LogChannel::PrintErr: return g_print_err_logger.get();
    case LogChannel::Error:    return g_error_logger.get();
    default:                   return g_info_logger.get();
  }
}

} // namespace

void init(bool verbose) {
  ensure_loggers();
  g_debug_enabled.store(verbose, std::memory_order_release);
  g_info_logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  spdlog::set_default_logger(g_info_logger);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

bool debug_logging_enabled() {
  return g_debug_enabled.load(std::memory_order_acquire);
}

const char* channel_label(LogChannel channel) {
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

Logger::Logger() = default;
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

bool Logger::dispatch(LogChannel channel,
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
      if(listener(channel, name_, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default(LogChannel::Error, name_, spdlog::level::err,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

namespace detail {

void emit_to_default(LogChannel channel,
                     const std::string& source,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  auto* sink = sink_for(channel);
  if(!sink) return;
  const bool plain = channel == LogChannel::Print || channel == LogChannel::PrintErr;
  if(!plain && !source.empty()) {
    sink->log(level, fmt::format("[{}] {}", source, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
