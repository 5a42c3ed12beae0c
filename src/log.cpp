#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstring>
#include <vector>

namespace {
std::mutex g_sink_mutex;
std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::shared_ptr<spdlog::sinks::basic_file_sink_mt> g_file_sink;
std::atomic<bool> g_log_passthrough{true};

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::sink_ptr console) {
  std::vector<spdlog::sink_ptr> sinks{std::move(console)};
  if(g_file_sink) sinks.push_back(g_file_sink);
  return std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
}

// Caller holds g_sink_mutex.
void build_loggers_locked() {
  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern(kStampedPattern);

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern(kStampedPattern);

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_info_logger = make_logger("meshshare.info", std::move(info_sink));
  g_error_logger = make_logger("meshshare.error", std::move(error_sink));
  g_print_logger = make_logger("meshshare.print", std::move(plain_out_sink));
  g_print_err_logger = make_logger("meshshare.print_err", std::move(plain_err_sink));

  g_info_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

std::shared_ptr<spdlog::logger> sink_for(const char* base_channel) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  if(!g_info_logger) build_loggers_locked();
  if(std::strcmp(base_channel, "print") == 0) return g_print_logger;
  if(std::strcmp(base_channel, "print_err") == 0) return g_print_err_logger;
  if(std::strcmp(base_channel, "error") == 0) return g_error_logger;
  return g_info_logger;
}

} // namespace

void init_logging(bool verbose, const std::string& log_file) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_file_sink.reset();
  if(!log_file.empty()) {
    g_file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
    g_file_sink->set_pattern(kStampedPattern);
  }
  build_loggers_locked();

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);
  spdlog::set_level(level);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger() : registry_(std::make_shared<ListenerRegistry>()) {}

Logger::Logger(std::string name)
  : name_(std::move(name)),
    registry_(std::make_shared<ListenerRegistry>()) {}

Logger::Logger(std::string name, std::shared_ptr<ListenerRegistry> registry)
  : name_(std::move(name)),
    registry_(std::move(registry)) {}

std::shared_ptr<Logger> Logger::child(const std::string& component) const {
  std::string child_name = name_.empty() ? component : name_ + "/" + component;
  return std::shared_ptr<Logger>(new Logger(std::move(child_name), registry_));
}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(registry_->mutex);
  const auto id = registry_->next_id++;
  registry_->listeners.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(registry_->mutex);
  registry_->listeners.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(registry_->mutex);
  registry_->listeners.clear();
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    snapshot.reserve(registry_->listeners.size());
    for(const auto& entry : registry_->listeners) {
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
      detail::emit_to_default("error", name_, spdlog::level::err,
                              std::string("log listener threw: ") + e.what());
    }
  }
  return handled;
}

void Logger::emit(const char* base_channel,
                  spdlog::level::level_enum level,
                  const std::string& message) const {
  detail::emit_to_default(base_channel, name_, level, message);
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& prefix,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  if(!log_passthrough()) return;
  auto sink = sink_for(base_channel);
  if(!sink) return;
  bool plain = std::strcmp(base_channel, "print") == 0 ||
               std::strcmp(base_channel, "print_err") == 0;
  if(!plain && !prefix.empty()) {
    sink->log(level, fmt::format("[{}] {}", prefix, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
