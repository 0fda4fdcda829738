#include "include/logging.hpp"
#include <mutex>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

static constexpr size_t kRingCapacity = 64;

static std::mutex log_mutex;
static std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink;
static std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> ring_sink;
static spdlog::level::level_enum console_level = spdlog::level::info;

void init_logging(bool debug) {
  std::lock_guard<std::mutex> lock(log_mutex);

  console_level = debug ? spdlog::level::debug : spdlog::level::info;

  if (!console_sink) {
    console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%n] [%^%l%$] %v");
    ring_sink =
        std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(kRingCapacity);
    ring_sink->set_pattern("%H:%M:%S.%e %l %v");

    auto logger = std::make_shared<spdlog::logger>(
        "glimpse", spdlog::sinks_init_list{console_sink, ring_sink});
    spdlog::set_default_logger(logger);
  }

  console_sink->set_level(console_level);
  spdlog::set_level(console_level);
}

void set_console_logging(bool enabled) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (console_sink)
    console_sink->set_level(enabled ? console_level : spdlog::level::off);
}

std::vector<std::string> recent_log_lines(size_t limit) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (!ring_sink)
    return {};
  return ring_sink->last_formatted(limit);
}
