//
// Created by garrett on 3/3/25.
//

#ifndef FILE_RECORD_HPP
#define FILE_RECORD_HPP

#include <cstdint>
#include <string>

/// @brief Observable state of one file at a point in time
struct FileRecord {
    std::string path;         // absolute, canonical
    uint64_t size = 0;
    double modifiedTime = 0.0; // seconds since the epoch
    std::string contentHash;  // empty when the file could not be hashed

    bool hasHash() const { return !contentHash.empty(); }
};

/// @brief Persisted shadow of a FileRecord, keyed by absolute path
struct CacheEntry {
    uint64_t size = 0;
    double modifiedTime = 0.0;
    std::string contentHash;
};

#endif //FILE_RECORD_HPP
