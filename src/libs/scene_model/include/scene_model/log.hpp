#pragma once

#include <spdlog/logger.h>
#include <memory>

namespace scene_model {

// Shared "iconoglott" logger. Created lazily with a stderr sink at warn level.
std::shared_ptr<spdlog::logger> pipeline_logger();

void set_pipeline_logger(std::shared_ptr<spdlog::logger> logger);

} // namespace scene_model
