//
// Created by garrett on 3/4/25.
//

#ifndef SYNC_CONTEXT_HPP
#define SYNC_CONTEXT_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_set>

#include "configuration.hpp"
#include "exclusion_filter.hpp"
#include "fingerprint_cache.hpp"
#include "statistics_collector.hpp"
#include "sync_observer.hpp"

namespace fs = std::filesystem;

/// State of one sync run. Built by SyncManager::run() and handed to every step,
/// dropped when the run ends.
struct SyncContext {
    SyncContext(const Configuration& config,
                FingerprintCache& cache,
                SyncObserver* observer,
                const std::atomic<bool>* interruptFlag)
        : config(config),
          cache(cache),
          observer(observer),
          interruptFlag(interruptFlag) {}

    SyncContext(const SyncContext&) = delete;
    SyncContext& operator=(const SyncContext&) = delete;

    const Configuration& config;
    FingerprintCache& cache;
    SyncObserver* observer;
    const std::atomic<bool>* interruptFlag;

    StatisticsCollector stats;
    const ExclusionFilter filter;

    fs::path sourceRoot;      // canonical
    fs::path destinationRoot; // absolute, canonical where it exists

    uint64_t totalFiles = 0;
    uint64_t processedFiles = 0;   // guarded by observerMutex
    std::mutex observerMutex;

    // Directories a simulate run pretends to have created, guarded by directoryMutex
    std::unordered_set<std::string> simulatedDirectories;
    std::mutex directoryMutex;

    bool interrupted() const {
        return interruptFlag != nullptr && interruptFlag->load();
    }

    void fileProcessed(const std::string& path) {
        std::lock_guard lock(observerMutex);
        ++processedFiles;
        if (observer) {
            observer->onFileProcessed(path, processedFiles, totalFiles);
        }
    }
};

#endif //SYNC_CONTEXT_HPP
