/**
 * @file log.cpp
 * @brief spdlog logger setup
 */

#include "crater/core/log.h"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <vector>

namespace crater::log {

namespace {

constexpr const char* LOGGER_NAME = "crater";

std::mutex& logger_mutex() {
    static std::mutex m;
    return m;
}

std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

std::shared_ptr<spdlog::logger> make_logger(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!config.file_path.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file_path, true));
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_pattern(config.pattern);
    logger->set_level(spdlog::level::from_str(config.level));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // anonymous namespace

void init(const LogConfig& config) {
    auto logger = make_logger(config);
    std::lock_guard lock(logger_mutex());
    logger_slot() = std::move(logger);
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard lock(logger_mutex());
    auto& logger = logger_slot();
    if (!logger) {
        logger = make_logger(LogConfig{});
    }
    return logger;
}

void shutdown() {
    std::lock_guard lock(logger_mutex());
    if (auto& logger = logger_slot()) {
        logger->flush();
        logger.reset();
    }
}

} // namespace crater::log
