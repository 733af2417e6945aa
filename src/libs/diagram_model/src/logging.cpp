#include <diagram_model/logging.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>

namespace diagram_model {

namespace {

const char* logger_name = "diagram_core";

std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

std::shared_ptr<spdlog::logger> make_logger(const std::string& file_path) {
    spdlog::drop(logger_name);
    try {
        std::shared_ptr<spdlog::logger> logger;
        if (file_path.empty()) {
            logger = spdlog::stderr_color_mt(logger_name);
        } else {
            const std::filesystem::path path(file_path);
            if (path.has_parent_path())
                std::filesystem::create_directories(path.parent_path());
            logger = spdlog::basic_logger_mt(logger_name, path.string(), true);
            logger->flush_on(spdlog::level::info);
        }
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        logger->set_level(spdlog::level::warn);
        return logger;
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::default_logger()->warn("diagram_core logger unavailable, using default: {}", e.what());
        return spdlog::default_logger();
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::default_logger()->warn("diagram_core log file unavailable, using default: {}", e.what());
        return spdlog::default_logger();
    }
}

} // namespace

std::shared_ptr<spdlog::logger> core_logger() {
    auto& logger = logger_slot();
    if (!logger) logger = make_logger({});
    return logger;
}

void configure_core_logger(const std::string& level, const std::string& file_path) {
    auto& logger = logger_slot();
    logger = make_logger(file_path);
    logger->set_level(spdlog::level::from_str(level));
    if (!file_path.empty())
        logger->info("Logger initialized. file={}", file_path);
}

} // namespace diagram_model
