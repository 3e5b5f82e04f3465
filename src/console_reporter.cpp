//
// Created by garrett on 3/5/25.
//

#include "console_reporter.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>

ConsoleReporter::ConsoleReporter(Options options, std::ostream& out)
    : m_options(std::move(options)),
      m_out(out) {
}

void ConsoleReporter::onFileCounted(uint64_t total) {
    m_out << "Found " << formatCount(total) << " files to process\n" << std::endl;
}

void ConsoleReporter::onFileProcessed(const std::string& currentPath, uint64_t processed, uint64_t total) {
    if (!m_options.showProgress || total == 0) {
        return;
    }

    const std::string fileName = std::filesystem::path(currentPath).filename().string();
    m_out << progressLine(fileName, processed, total) << std::flush;
    m_progressShown = true;
}

void ConsoleReporter::onRunComplete(const RunStatistics& stats, std::chrono::milliseconds duration) {
    if (m_progressShown) {
        m_out << "\n";  // New line after progress bar
    }

    const std::string rule(60, '=');
    m_out << "\n" << rule << "\n"
          << "SYNCHRONIZATION SUMMARY\n"
          << rule << "\n"
          << "Source:      " << m_options.source << "\n"
          << "Destination: " << m_options.destination << "\n"
          << "Duration:    " << formatDuration(duration) << "\n"
          << "Dry run:     " << (m_options.simulate ? "True" : "False") << "\n"
          << std::string(60, '-') << "\n"
          << "Files checked:       " << formatCount(stats.filesChecked) << "\n"
          << "Files copied:        " << formatCount(stats.filesCopied) << "\n"
          << "Files skipped:       " << formatCount(stats.filesSkipped) << "\n"
          << "Files excluded:      " << formatCount(stats.filesExcluded) << "\n"
          << "Directories created: " << formatCount(stats.directoriesCreated) << "\n"
          << "Bytes copied:        " << formatCount(stats.bytesCopied)
          << " (" << formatBytes(stats.bytesCopied) << ")\n"
          << "Errors:              " << formatCount(stats.errors) << "\n"
          << rule << std::endl;

    if (stats.errors > 0) {
        m_out << "\nWARNING: " << stats.errors << " errors occurred during synchronization!\n"
              << "Check the log file '" << m_options.logFile << "' for details." << std::endl;
    }
}

std::string ConsoleReporter::progressLine(const std::string& fileName, uint64_t processed, uint64_t total) {
    // Files added after counting can push processed past total
    const double progress = total == 0 ? 0.0
        : std::min(1.0, static_cast<double>(processed) / static_cast<double>(total));
    const int filled = static_cast<int>(BAR_LENGTH * progress);

    std::stringstream ss;
    ss << "\r[" << std::string(filled, '#') << std::string(BAR_LENGTH - filled, '-') << "] "
       << std::fixed << std::setprecision(1) << progress * 100.0 << "% "
       << "(" << processed << "/" << total << ")";

    if (!fileName.empty()) {
        // Truncate filename if too long
        if (fileName.size() <= MAX_NAME_LENGTH) {
            ss << " - " << fileName;
        } else {
            ss << " - ..." << fileName.substr(fileName.size() - (MAX_NAME_LENGTH - 3));
        }
    }
    return ss.str();
}

std::string ConsoleReporter::formatBytes(uint64_t bytes) {
    static const char* UNITS[] = {"B", "KB", "MB", "GB", "TB"};

    double value = static_cast<double>(bytes);
    std::stringstream ss;
    ss << std::fixed << std::setprecision(1);
    for (const char* unit : UNITS) {
        if (value < 1024.0) {
            ss << value << " " << unit;
            return ss.str();
        }
        value /= 1024.0;
    }
    ss << value << " PB";
    return ss.str();
}

std::string ConsoleReporter::formatCount(uint64_t value) {
    std::string digits = std::to_string(value);
    std::string result;
    result.reserve(digits.size() + digits.size() / 3);

    const size_t leading = digits.size() % 3;
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (i % 3) == leading) {
            result.push_back(',');
        }
        result.push_back(digits[i]);
    }
    return result;
}

std::string ConsoleReporter::formatDuration(std::chrono::milliseconds duration) {
    const auto hours = std::chrono::duration_cast<std::chrono::hours>(duration);
    const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(duration - hours);
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration - hours - minutes);
    const auto millis = duration - hours - minutes - seconds;

    std::stringstream ss;
    ss << hours.count() << ":"
       << std::setw(2) << std::setfill('0') << minutes.count() << ":"
       << std::setw(2) << std::setfill('0') << seconds.count() << "."
       << std::setw(3) << std::setfill('0') << millis.count();
    return ss.str();
}
