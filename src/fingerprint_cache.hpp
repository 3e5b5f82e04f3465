//
// Created by garrett on 2/24/25.
//

#ifndef FINGERPRINT_CACHE_HPP
#define FINGERPRINT_CACHE_HPP

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <json/json.h>  // Uses jsoncpp library

#include "file_record.hpp"

namespace fs = std::filesystem;

// Persistent path -> {size, mtime, hash} store used to skip rehashing unchanged files.
// Keys are canonical absolute paths, so moving a tree invalidates its entries.
class FingerprintCache {
public:
    // Largest mtime difference still treated as the same timestamp
    static constexpr double MTIME_TOLERANCE_SECONDS = 1.0;

    explicit FingerprintCache(std::string cacheFilePath);

    FingerprintCache(const FingerprintCache&) = delete;
    FingerprintCache& operator=(const FingerprintCache&) = delete;

    /// @brief Replace the in-memory entries with the ones stored on disk
    /// @return number of entries loaded; a missing or corrupt file yields 0
    size_t load();

    /// @brief Entry for path if it still matches the file's size and mtime
    std::optional<CacheEntry> lookupValid(const std::string& path, uint64_t currentSize, double currentMtime) const;

    /// @brief Insert or overwrite the entry for path
    void update(const std::string& path, const FileRecord& record);

    /// @brief Write every entry back to the cache file, replacing it atomically
    /// @return false if the cache could not be written (logged, never thrown)
    bool persist() const;

    std::optional<CacheEntry> entry(const std::string& path) const;

    size_t size() const;

    const std::string& filePath() const { return m_cacheFilePath; }

    /// @brief Canonical absolute form of path used as the cache key
    static std::string resolveKey(const fs::path& path);

private:
    std::string m_cacheFilePath;
    std::unordered_map<std::string, CacheEntry> m_entries;
    mutable std::mutex m_mutex;

    static Json::Value toJson(const CacheEntry& entry);
    static std::optional<CacheEntry> fromJson(const Json::Value& json);
};

#endif //FINGERPRINT_CACHE_HPP
