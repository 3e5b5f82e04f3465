//
// Created by garrett on 2/23/25.
//

#include "statistics_collector.hpp"

auto StatisticsCollector::recordChecked() -> void {
    m_filesChecked.fetch_add(1, std::memory_order_relaxed);
}

auto StatisticsCollector::recordCopied(uint64_t bytes) -> void {
    m_filesCopied.fetch_add(1, std::memory_order_relaxed);
    m_bytesCopied.fetch_add(bytes, std::memory_order_relaxed);
}

auto StatisticsCollector::recordSkipped() -> void {
    m_filesSkipped.fetch_add(1, std::memory_order_relaxed);
}

auto StatisticsCollector::recordExcluded() -> void {
    m_filesExcluded.fetch_add(1, std::memory_order_relaxed);
}

auto StatisticsCollector::recordDirectoriesCreated(uint64_t count) -> void {
    m_directoriesCreated.fetch_add(count, std::memory_order_relaxed);
}

auto StatisticsCollector::recordError() -> void {
    m_errors.fetch_add(1, std::memory_order_relaxed);
}

auto StatisticsCollector::snapshot() const -> RunStatistics {
    RunStatistics stats;
    stats.filesChecked = m_filesChecked.load();
    stats.filesCopied = m_filesCopied.load();
    stats.filesSkipped = m_filesSkipped.load();
    stats.filesExcluded = m_filesExcluded.load();
    stats.directoriesCreated = m_directoriesCreated.load();
    stats.bytesCopied = m_bytesCopied.load();
    stats.errors = m_errors.load();
    return stats;
}
