#pragma once
/**
 * @file log.h
 * @brief Library-wide spdlog logger
 */

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace crater::log {

/**
 * @brief Logger setup, usually loaded as part of CoreConfig
 */
struct LogConfig {
    std::string level{"info"};                                  ///< trace|debug|info|warn|error|critical|off
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v"};
    std::string file_path;                                      ///< Empty = console only
    bool console{true};
};

/**
 * @brief (Re)create the "crater" logger from the given settings
 * @throws spdlog::spdlog_ex if the file sink cannot be opened
 */
void init(const LogConfig& config);

/**
 * @brief Shared logger; a default console logger is created on first use
 */
std::shared_ptr<spdlog::logger> get();

/**
 * @brief Drop the logger (tests, host shutdown)
 */
void shutdown();

} // namespace crater::log
