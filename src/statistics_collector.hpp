//
// Created by garrett on 2/23/25.
//

#ifndef STATISTICS_COLLECTOR_HPP
#define STATISTICS_COLLECTOR_HPP

#include <atomic>
#include <cstdint>

#include "run_statistics.hpp"

// Run counters that worker threads can bump without locking
class StatisticsCollector {
private:
    std::atomic<uint64_t> m_filesChecked{0};
    std::atomic<uint64_t> m_filesCopied{0};
    std::atomic<uint64_t> m_filesSkipped{0};
    std::atomic<uint64_t> m_filesExcluded{0};
    std::atomic<uint64_t> m_directoriesCreated{0};
    std::atomic<uint64_t> m_bytesCopied{0};
    std::atomic<uint64_t> m_errors{0};

public:
    StatisticsCollector() = default;
    StatisticsCollector(const StatisticsCollector&) = delete;
    StatisticsCollector& operator=(const StatisticsCollector&) = delete;

    void recordChecked();
    void recordCopied(uint64_t bytes);
    void recordSkipped();
    void recordExcluded();
    void recordDirectoriesCreated(uint64_t count = 1);
    void recordError();

    RunStatistics snapshot() const;
};

#endif //STATISTICS_COLLECTOR_HPP
