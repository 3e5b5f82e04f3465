

#ifndef SYNC_MANAGER_HPP
#define SYNC_MANAGER_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "file_record.hpp"
#include "run_statistics.hpp"


class Configuration;
class FingerprintCache;
class SyncObserver;
struct SyncContext;

/// @brief Result of one SyncManager::run()
struct SyncReport {
    RunStatistics stats;
    std::chrono::milliseconds duration{0};
    bool interrupted{false};
};

/// class that mirrors the source tree into the destination, copying only new or changed files
class SyncManager
{
public:
    enum class State {
        IDLE,
        INITIALIZING,
        COUNTING,
        SYNCING,
        FINALIZING,
        DONE
    };

    SyncManager(std::shared_ptr<Configuration> config, std::shared_ptr<SyncObserver> observer = nullptr);
    ~SyncManager();
    SyncManager(const SyncManager&) = delete;
    SyncManager& operator=(const SyncManager&) = delete;
    SyncManager(SyncManager&&) = delete;
    SyncManager& operator=(SyncManager&&) = delete;

    /// @brief Run Initializing -> Counting -> Syncing -> Finalizing once
    /// @throws InvalidSourceError if the source is missing or not a directory
    /// @throws InvalidDestinationError if the destination cannot be used
    SyncReport run();

    /// @brief Flag polled between files; once set the run stops early and reports interrupted
    void setInterruptFlag(const std::atomic<bool>* flag);

    State state() const;

    const FingerprintCache& cache() const;


private:
    std::shared_ptr<Configuration> config;
    std::shared_ptr<SyncObserver> observer;
    std::unique_ptr<FingerprintCache> m_cache;
    const std::atomic<bool>* m_interruptFlag{nullptr};
    std::atomic<State> m_state{State::IDLE};

    using FileVisitor = std::function<void(const std::filesystem::path&, const std::filesystem::path&)>;

    void initialize(SyncContext& ctx);
    uint64_t countFiles(SyncContext& ctx);
    void syncFiles(SyncContext& ctx);
    void finalize(SyncContext& ctx, SyncReport& report);

    static void walkSource(SyncContext& ctx, bool countingPass, const FileVisitor& onFile);
    static void processFile(SyncContext& ctx, const std::filesystem::path& sourcePath, const std::filesystem::path& relativePath);
    static void syncFile(SyncContext& ctx, const std::filesystem::path& sourcePath, const std::filesystem::path& relativePath);
    static std::optional<FileRecord> inspectFile(SyncContext& ctx, const std::filesystem::path& path);
    static void copyFile(SyncContext& ctx, const std::filesystem::path& sourcePath,
                         const std::filesystem::path& destPath, const FileRecord& sourceRecord);
    static void ensureParentDirectory(SyncContext& ctx, const std::filesystem::path& directory);
};


#endif //SYNC_MANAGER_HPP
