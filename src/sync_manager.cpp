//
// Created by garrett on 2/23/25.
//

#include "sync_manager.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>
#include <vector>

#include "change_detector.hpp"
#include "configuration.hpp"
#include "content_fingerprinter.hpp"
#include "fingerprint_cache.hpp"
#include "logging.hpp"
#include "sync_context.hpp"
#include "sync_errors.hpp"
#include "sync_observer.hpp"
#include "thread_pool.hpp"

namespace fs = std::filesystem;

namespace {

double toEpochSeconds(fs::file_time_type fileTime) {
    auto systemTime = std::chrono::file_clock::to_sys(fileTime);
    return std::chrono::duration<double>(systemTime.time_since_epoch()).count();
}

} // namespace

SyncManager::SyncManager(std::shared_ptr<Configuration> config, std::shared_ptr<SyncObserver> observer)
    : config(std::move(config)),
      observer(std::move(observer)),
      m_cache(std::make_unique<FingerprintCache>(this->config->cache_file)) {
}

SyncManager::~SyncManager() = default;

void SyncManager::setInterruptFlag(const std::atomic<bool>* flag) {
    m_interruptFlag = flag;
}

SyncManager::State SyncManager::state() const {
    return m_state.load();
}

const FingerprintCache& SyncManager::cache() const {
    return *m_cache;
}

SyncReport SyncManager::run() {
    const auto startTime = std::chrono::steady_clock::now();
    SyncContext ctx(*config, *m_cache, observer.get(), m_interruptFlag);

    m_state = State::INITIALIZING;
    initialize(ctx);

    m_state = State::COUNTING;
    ctx.totalFiles = countFiles(ctx);
    if (observer) {
        observer->onFileCounted(ctx.totalFiles);
    }

    m_state = State::SYNCING;
    syncFiles(ctx);

    m_state = State::FINALIZING;
    SyncReport report;
    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    finalize(ctx, report);

    m_state = State::DONE;
    return report;
}

void SyncManager::initialize(SyncContext& ctx) {
    const fs::path source(config->source);
    const fs::path destination(config->destination);
    std::error_code ec;

    if (!fs::exists(source, ec)) {
        throw InvalidSourceError("Source path does not exist: " + source.string());
    }
    if (!fs::is_directory(source, ec)) {
        throw InvalidSourceError("Source path is not a directory: " + source.string());
    }

    ctx.sourceRoot = fs::canonical(source, ec);
    if (ec) {
        throw InvalidSourceError("Cannot resolve source path " + source.string() + ": " + ec.message());
    }

    ctx.destinationRoot = fs::weakly_canonical(fs::absolute(destination), ec);
    if (ec) {
        throw InvalidDestinationError("Cannot resolve destination path " + destination.string() + ": " + ec.message());
    }

    auto log = logging::get();
    log->info("Starting sync: {} -> {}", logging::displayPath(ctx.sourceRoot), logging::displayPath(ctx.destinationRoot));
    log->info("Dry run mode: {}", config->simulate);

    if (fs::exists(ctx.destinationRoot, ec)) {
        if (!fs::is_directory(ctx.destinationRoot, ec)) {
            throw InvalidDestinationError("Destination path is not a directory: " + ctx.destinationRoot.string());
        }
    } else if (config->simulate) {
        std::lock_guard lock(ctx.directoryMutex);
        ctx.simulatedDirectories.insert(ctx.destinationRoot.string());
        log->info("Would create destination directory: {}", logging::displayPath(ctx.destinationRoot));
        ctx.stats.recordDirectoriesCreated();
    } else {
        fs::create_directories(ctx.destinationRoot, ec);
        if (ec) {
            throw InvalidDestinationError("Cannot create destination directory " +
                                          ctx.destinationRoot.string() + ": " + ec.message());
        }
        log->info("Created destination directory: {}", logging::displayPath(ctx.destinationRoot));
        ctx.stats.recordDirectoriesCreated();
    }

    const size_t cached = ctx.cache.load();
    log->debug("Fingerprint cache {} holds {} entries", ctx.cache.filePath(), cached);
}

uint64_t SyncManager::countFiles(SyncContext& ctx) {
    uint64_t count = 0;
    walkSource(ctx, true, [&count](const fs::path&, const fs::path&) {
        count++;
    });
    logging::get()->debug("Found {} files to process", count);
    return count;
}

void SyncManager::syncFiles(SyncContext& ctx) {
    if (config->num_threads <= 1) {
        walkSource(ctx, false, [&ctx](const fs::path& sourcePath, const fs::path& relativePath) {
            processFile(ctx, sourcePath, relativePath);
        });
        return;
    }

    ThreadPool pool;
    pool.start(static_cast<size_t>(config->num_threads));
    logging::get()->debug("Syncing with {} worker threads", pool.size());

    walkSource(ctx, false, [&ctx, &pool](const fs::path& sourcePath, const fs::path& relativePath) {
        pool.enqueue([&ctx, sourcePath, relativePath]() {
            processFile(ctx, sourcePath, relativePath);
        });
    });

    // In-flight copies always finish, queued files return early once interrupted
    pool.wait();
    pool.stop();
}

void SyncManager::finalize(SyncContext& ctx, SyncReport& report) {
    auto log = logging::get();

    report.interrupted = ctx.interrupted();
    if (report.interrupted) {
        log->warn("Sync interrupted after {} of {} files", ctx.processedFiles, ctx.totalFiles);
    }

    // Losing the cache only costs rehashing on the next run
    if (!ctx.cache.persist()) {
        log->warn("Fingerprint cache was not saved, the next run will rehash");
    }

    report.stats = ctx.stats.snapshot();
    log->info("Sync finished: {} checked, {} copied, {} skipped, {} excluded, {} errors",
              report.stats.filesChecked, report.stats.filesCopied, report.stats.filesSkipped,
              report.stats.filesExcluded, report.stats.errors);

    if (observer) {
        std::lock_guard lock(ctx.observerMutex);
        observer->onRunComplete(report.stats, report.duration);
    }
}

void SyncManager::walkSource(SyncContext& ctx, bool countingPass, const FileVisitor& onFile) {
    auto log = logging::get();

    std::vector<fs::path> pending;
    pending.push_back(ctx.sourceRoot);

    while (!pending.empty()) {
        if (ctx.interrupted()) {
            return;
        }

        const fs::path current = pending.back();
        pending.pop_back();

        std::vector<fs::directory_entry> entries;
        std::error_code ec;
        fs::directory_iterator it(current, ec);
        fs::directory_iterator end;
        for (; !ec && it != end; it.increment(ec)) {
            entries.push_back(*it);
        }
        if (ec) {
            if (!countingPass) {
                log->warn("Skipping unreadable directory {}: {}", logging::displayPath(current), ec.message());
            }
            if (entries.empty()) {
                continue;
            }
        }

        std::sort(entries.begin(), entries.end(), [](const fs::directory_entry& a, const fs::directory_entry& b) {
            return a.path().filename() < b.path().filename();
        });

        std::vector<fs::path> subdirectories;
        for (const auto& entry : entries) {
            if (ctx.interrupted()) {
                return;
            }

            const fs::path& path = entry.path();
            const std::string name = path.filename().string();
            std::error_code statusError;

            if (entry.is_directory(statusError)) {
                if (entry.is_symlink(statusError)) {
                    if (!countingPass) {
                        log->debug("Not following directory symlink: {}", logging::displayPath(path));
                    }
                    continue;
                }
                if (ctx.filter.isExcludedName(name)) {
                    if (!countingPass) {
                        log->debug("Excluded directory (platform metadata): {}", logging::displayPath(path));
                    }
                    continue;
                }
                if (path == ctx.destinationRoot) {
                    if (!countingPass) {
                        log->debug("Skipping destination nested in source: {}", logging::displayPath(path));
                    }
                    continue;
                }
                subdirectories.push_back(path);
                continue;
            }

            const fs::path relativePath = path.lexically_relative(ctx.sourceRoot);

            if (ctx.filter.isExcluded(relativePath)) {
                if (!countingPass) {
                    ctx.stats.recordExcluded();
                    log->debug("Excluded (platform metadata): {}", logging::displayPath(path));
                }
                continue;
            }

            // Symlinks to files are followed, sockets, FIFOs and dangling links are not synced
            if (!entry.is_regular_file(statusError)) {
                if (!countingPass) {
                    log->warn("Skipping non-regular file: {}", logging::displayPath(path));
                }
                continue;
            }

            onFile(path, relativePath);
        }

        // Reverse so the alphabetically first directory is walked next
        for (auto dir = subdirectories.rbegin(); dir != subdirectories.rend(); ++dir) {
            pending.push_back(*dir);
        }
    }
}

void SyncManager::processFile(SyncContext& ctx, const fs::path& sourcePath, const fs::path& relativePath) {
    // Worker threads must never see an exception escape, one file's failure stays with that file
    try {
        syncFile(ctx, sourcePath, relativePath);
    } catch (const std::exception& e) {
        logging::get()->error("Error processing {}: {}", logging::displayPath(sourcePath), e.what());
        ctx.stats.recordError();
    }
}

void SyncManager::syncFile(SyncContext& ctx, const fs::path& sourcePath, const fs::path& relativePath) {
    if (ctx.interrupted()) {
        return;
    }

    auto log = logging::get();
    const fs::path destPath = ctx.destinationRoot / relativePath;

    ctx.stats.recordChecked();
    ctx.fileProcessed(sourcePath.string());
    log->debug("Checking: {}", logging::displayPath(sourcePath));

    auto sourceRecord = inspectFile(ctx, sourcePath);
    if (!sourceRecord) {
        return;
    }

    std::optional<FileRecord> destRecord;
    std::error_code ec;
    const auto destStatus = fs::status(destPath, ec);
    if (fs::exists(destStatus)) {
        if (!fs::is_regular_file(destStatus)) {
            log->error("Destination exists and is not a regular file: {}", logging::displayPath(destPath));
            ctx.stats.recordError();
            return;
        }
        destRecord = inspectFile(ctx, destPath);
    }

    const auto reason = ChangeDetector::classify(*sourceRecord, destRecord);
    if (reason == ChangeDetector::ChangeReason::UNCHANGED) {
        ctx.stats.recordSkipped();
        log->debug("Skipped (unchanged): {}", logging::displayPath(sourcePath));
        return;
    }

    log->debug("Needs copy ({}): {}", ChangeDetector::describe(reason), logging::displayPath(sourcePath));
    copyFile(ctx, sourcePath, destPath, *sourceRecord);
}

std::optional<FileRecord> SyncManager::inspectFile(SyncContext& ctx, const fs::path& path) {
    std::error_code ec;

    const uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        logging::get()->error("Error getting file info for {}: {}", logging::displayPath(path), ec.message());
        ctx.stats.recordError();
        return std::nullopt;
    }

    const auto lastWrite = fs::last_write_time(path, ec);
    if (ec) {
        logging::get()->error("Error getting file info for {}: {}", logging::displayPath(path), ec.message());
        ctx.stats.recordError();
        return std::nullopt;
    }

    FileRecord record;
    record.path = FingerprintCache::resolveKey(path);
    record.size = static_cast<uint64_t>(size);
    record.modifiedTime = toEpochSeconds(lastWrite);

    // Size and mtime still match what was hashed last time, reuse the digest
    auto cached = ctx.cache.lookupValid(record.path, record.size, record.modifiedTime);
    if (cached && !cached->contentHash.empty()) {
        record.contentHash = cached->contentHash;
        return record;
    }

    record.contentHash = ContentFingerprinter::fingerprint(path.string());
    if (!record.hasHash()) {
        // Left out of the cache so the next run retries the read
        ctx.stats.recordError();
        return record;
    }

    ctx.cache.update(record.path, record);
    return record;
}

void SyncManager::copyFile(SyncContext& ctx, const fs::path& sourcePath,
                           const fs::path& destPath, const FileRecord& sourceRecord) {
    auto log = logging::get();
    const bool simulate = ctx.config.simulate;

    try {
        ensureParentDirectory(ctx, destPath.parent_path());

        if (simulate) {
            log->info("Would copy: {} -> {}", logging::displayPath(sourcePath), logging::displayPath(destPath));
        } else {
            fs::copy_file(sourcePath, destPath, fs::copy_options::overwrite_existing);

            // Preserve timestamps
            fs::last_write_time(destPath, fs::last_write_time(sourcePath));
            log->info("Copied: {} -> {}", logging::displayPath(sourcePath), logging::displayPath(destPath));

            // The destination now holds the source content, remember it so the next run skips rehashing
            if (sourceRecord.hasHash()) {
                FileRecord destRecord = sourceRecord;
                destRecord.path = FingerprintCache::resolveKey(destPath);
                ctx.cache.update(destRecord.path, destRecord);
            }
        }

        ctx.stats.recordCopied(sourceRecord.size);
    } catch (const fs::filesystem_error& e) {
        log->error("Error copying {} to {}: {}", logging::displayPath(sourcePath), logging::displayPath(destPath), e.what());
        ctx.stats.recordError();
    }
}

void SyncManager::ensureParentDirectory(SyncContext& ctx, const fs::path& directory) {
    // Serialized so concurrent workers create and count each directory once
    std::lock_guard lock(ctx.directoryMutex);

    std::vector<fs::path> missing;
    for (fs::path current = directory; !current.empty() && current != current.root_path();
         current = current.parent_path()) {
        if (ctx.simulatedDirectories.count(current.string()) > 0) {
            break;
        }
        std::error_code ec;
        if (fs::exists(current, ec)) {
            break;
        }
        missing.push_back(current);
    }

    if (missing.empty()) {
        return;
    }

    auto log = logging::get();
    if (ctx.config.simulate) {
        for (const auto& dir : missing) {
            ctx.simulatedDirectories.insert(dir.string());
        }
        log->debug("Would create directory: {}", logging::displayPath(directory));
    } else {
        fs::create_directories(directory);
        log->debug("Created directory: {}", logging::displayPath(directory));
    }

    ctx.stats.recordDirectoriesCreated(missing.size());
}
