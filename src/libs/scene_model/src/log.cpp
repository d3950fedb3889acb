#include <scene_model/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <mutex>

namespace scene_model {

namespace {

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> active_logger;

} // namespace

std::shared_ptr<spdlog::logger> pipeline_logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (active_logger) return active_logger;

    try {
        active_logger = spdlog::stderr_color_mt("iconoglott");
        active_logger->set_level(spdlog::level::warn);
        active_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    } catch (const spdlog::spdlog_ex&) {
        active_logger = spdlog::default_logger();
    }
    return active_logger;
}

void set_pipeline_logger(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    active_logger = std::move(logger);
}

} // namespace scene_model
