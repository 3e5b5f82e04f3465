//
// Created by garrett on 3/4/25.
//

#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace logging {

inline constexpr const char* LOGGER_NAME = "mirrorsync";
inline constexpr const char* LOG_FORMAT = "%Y-%m-%d %H:%M:%S,%e - %l - %v";

/// @brief Create the `mirrorsync` logger writing to the console and appending to logFile
/// @param logFile
/// @param verbose debug level when true, info otherwise
void init(const std::string& logFile, bool verbose);

/// @brief Drop the registered logger, flushing its sinks
void shutdown();

/// @brief The registered logger, or spdlog's default logger before init()
std::shared_ptr<spdlog::logger> get();

/// @brief Render a path for log output without failing on undisplayable bytes
std::string displayPath(const std::filesystem::path& path);

} // namespace logging

#endif //LOGGING_HPP
