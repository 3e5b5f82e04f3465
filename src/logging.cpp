//
// Created by garrett on 3/4/25.
//

#include "logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <vector>

namespace logging {

namespace {

bool isContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Strict UTF-8 check: rejects overlong forms, surrogates and code points past U+10FFFF
bool isValidUtf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);
        size_t length;
        uint32_t codePoint;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            length = 2;
            codePoint = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            length = 3;
            codePoint = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            length = 4;
            codePoint = c & 0x07;
        } else {
            return false;
        }

        if (i + length > text.size()) {
            return false;
        }
        for (size_t k = 1; k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if (!isContinuation(next)) {
                return false;
            }
            codePoint = (codePoint << 6) | (next & 0x3F);
        }

        if ((length == 2 && codePoint < 0x80) ||
            (length == 3 && codePoint < 0x800) ||
            (length == 4 && codePoint < 0x10000) ||
            codePoint > 0x10FFFF ||
            (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}

std::string escapeBytes(std::string_view text) {
    std::ostringstream ss;
    for (char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (c >= 0x20 && c < 0x7F) {
            ss << ch;
        } else {
            ss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return ss.str();
}

} // namespace

void init(const std::string& logFile, bool verbose) {
    // Re-initialization replaces the previous logger
    spdlog::drop(LOGGER_NAME);

    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_color_mode(spdlog::color_mode::automatic);
    sinks.push_back(console);

    std::string fileError;
    try {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, /*truncate=*/false));
    } catch (const spdlog::spdlog_ex& e) {
        fileError = e.what();
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_pattern(LOG_FORMAT);
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);

    if (!fileError.empty()) {
        logger->warn("Cannot open log file {}, logging to console only: {}", logFile, fileError);
    }
}

void shutdown() {
    if (auto logger = spdlog::get(LOGGER_NAME)) {
        logger->flush();
    }
    spdlog::drop(LOGGER_NAME);
}

std::shared_ptr<spdlog::logger> get() {
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        return spdlog::default_logger();
    }
    return logger;
}

std::string displayPath(const std::filesystem::path& path) {
    const std::string& full = path.native();
    if (isValidUtf8(full)) {
        return full;
    }

    const std::string name = path.filename().native();
    if (isValidUtf8(name)) {
        return name + " (non-UTF-8 path)";
    }
    return escapeBytes(name) + " (non-UTF-8 path)";
}

} // namespace logging
