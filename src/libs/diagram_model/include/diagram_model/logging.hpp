#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace diagram_model {

// Shared "diagram_core" logger. Writes to stderr until configure_core_logger()
// points it at a file.
std::shared_ptr<spdlog::logger> core_logger();

// level: spdlog level name ("trace" .. "off"); empty file_path keeps stderr.
void configure_core_logger(const std::string& level, const std::string& file_path = {});

} // namespace diagram_model
