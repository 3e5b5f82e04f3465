//
// Created by garrett on 3/5/25.
//

#ifndef CONSOLE_REPORTER_HPP
#define CONSOLE_REPORTER_HPP

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

#include "sync_observer.hpp"

// Progress bar and end-of-run summary on a terminal
class ConsoleReporter : public SyncObserver {
public:
    struct Options {
        std::string source;
        std::string destination;
        std::string logFile;
        bool simulate = false;
        bool showProgress = true;
    };

    explicit ConsoleReporter(Options options, std::ostream& out = std::cout);

    void onFileCounted(uint64_t total) override;
    void onFileProcessed(const std::string& currentPath, uint64_t processed, uint64_t total) override;
    void onRunComplete(const RunStatistics& stats, std::chrono::milliseconds duration) override;

    static std::string progressLine(const std::string& fileName, uint64_t processed, uint64_t total);
    static std::string formatBytes(uint64_t bytes);
    static std::string formatCount(uint64_t value);
    static std::string formatDuration(std::chrono::milliseconds duration);

    static constexpr int BAR_LENGTH = 40;
    static constexpr size_t MAX_NAME_LENGTH = 50;

private:
    Options m_options;
    std::ostream& m_out;
    bool m_progressShown{false};
};

#endif //CONSOLE_REPORTER_HPP
