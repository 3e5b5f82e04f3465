//
// Created by garrett on 3/3/25.
//

#ifndef SYNC_OBSERVER_HPP
#define SYNC_OBSERVER_HPP

#include <chrono>
#include <cstdint>
#include <string>

#include "run_statistics.hpp"

/// Receives progress from a sync run. Calls are serialized by the SyncManager,
/// implementations do not need their own locking.
class SyncObserver {
public:
    virtual ~SyncObserver() = default;

    /// @brief Total number of files the run will check
    virtual void onFileCounted(uint64_t total) = 0;

    /// @brief A file has been checked (copied or skipped)
    /// @param currentPath source path of the file
    /// @param processed files checked so far, including this one
    /// @param total value previously passed to onFileCounted
    virtual void onFileProcessed(const std::string& currentPath, uint64_t processed, uint64_t total) = 0;

    /// @brief The run has finished and the cache has been saved
    virtual void onRunComplete(const RunStatistics& stats, std::chrono::milliseconds duration) = 0;
};

#endif //SYNC_OBSERVER_HPP
