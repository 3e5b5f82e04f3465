//
// Created by garrett on 2/24/25.
//

#include "fingerprint_cache.hpp"
#include "logging.hpp"

#include <cmath>
#include <fstream>
#include <system_error>

FingerprintCache::FingerprintCache(std::string cacheFilePath)
    : m_cacheFilePath(std::move(cacheFilePath)) {
}

size_t FingerprintCache::load() {
    std::lock_guard lock(m_mutex);
    m_entries.clear();

    std::error_code ec;
    if (!fs::exists(m_cacheFilePath, ec)) {
        logging::get()->debug("No fingerprint cache at {}, starting empty", m_cacheFilePath);
        return 0;
    }

    std::ifstream inFile(m_cacheFilePath);
    if (!inFile) {
        logging::get()->warn("Cannot read fingerprint cache {}, starting empty", m_cacheFilePath);
        return 0;
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    JSONCPP_STRING errs;

    if (!Json::parseFromStream(builder, inFile, &root, &errs)) {
        logging::get()->warn("Corrupt fingerprint cache {}, starting empty: {}", m_cacheFilePath, errs);
        return 0;
    }

    if (!root.isObject()) {
        logging::get()->warn("Fingerprint cache {} is not a JSON object, starting empty", m_cacheFilePath);
        return 0;
    }

    size_t skipped = 0;
    for (const auto& key : root.getMemberNames()) {
        auto entry = fromJson(root[key]);
        if (!entry) {
            skipped++;
            continue;
        }
        m_entries[key] = *entry;
    }

    if (skipped > 0) {
        logging::get()->warn("Ignored {} malformed entries in fingerprint cache {}", skipped, m_cacheFilePath);
    }
    logging::get()->debug("Loaded {} fingerprint cache entries from {}", m_entries.size(), m_cacheFilePath);
    return m_entries.size();
}

std::optional<CacheEntry> FingerprintCache::lookupValid(const std::string& path,
                                                        uint64_t currentSize,
                                                        double currentMtime) const {
    std::lock_guard lock(m_mutex);

    auto it = m_entries.find(path);
    if (it == m_entries.end()) {
        return std::nullopt;
    }

    // A size or timestamp change means the stored hash may no longer describe the file
    const CacheEntry& cached = it->second;
    if (cached.size != currentSize ||
        std::fabs(cached.modifiedTime - currentMtime) > MTIME_TOLERANCE_SECONDS) {
        return std::nullopt;
    }

    return cached;
}

void FingerprintCache::update(const std::string& path, const FileRecord& record) {
    std::lock_guard lock(m_mutex);
    m_entries[path] = CacheEntry{record.size, record.modifiedTime, record.contentHash};
}

bool FingerprintCache::persist() const {
    Json::Value root(Json::objectValue);
    {
        std::lock_guard lock(m_mutex);
        for (const auto& [path, cached] : m_entries) {
            root[path] = toJson(cached);
        }
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    // Keys are raw path bytes, write them unchanged instead of re-encoding
    builder["emitUTF8"] = true;

    // Write beside the cache and rename over it so an interrupted save keeps the old file
    const std::string tempPath = m_cacheFilePath + ".tmp";
    {
        std::ofstream outFile(tempPath, std::ios::trunc);
        if (!outFile) {
            logging::get()->warn("Cannot write fingerprint cache {}", tempPath);
            return false;
        }
        outFile << Json::writeString(builder, root) << "\n";
        outFile.flush();
        if (!outFile) {
            logging::get()->warn("Failed writing fingerprint cache {}", tempPath);
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, m_cacheFilePath, ec);
    if (ec) {
        logging::get()->warn("Cannot replace fingerprint cache {}: {}", m_cacheFilePath, ec.message());
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        return false;
    }

    logging::get()->debug("Saved {} fingerprint cache entries to {}", root.size(), m_cacheFilePath);
    return true;
}

std::optional<CacheEntry> FingerprintCache::entry(const std::string& path) const {
    std::lock_guard lock(m_mutex);
    auto it = m_entries.find(path);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t FingerprintCache::size() const {
    std::lock_guard lock(m_mutex);
    return m_entries.size();
}

std::string FingerprintCache::resolveKey(const fs::path& path) {
    std::error_code ec;
    fs::path resolved = fs::canonical(path, ec);
    if (!ec) {
        return resolved.string();
    }

    resolved = fs::absolute(path, ec);
    if (!ec) {
        return resolved.lexically_normal().string();
    }
    return path.string();
}

Json::Value FingerprintCache::toJson(const CacheEntry& entry) {
    Json::Value json;
    json["size"] = static_cast<Json::UInt64>(entry.size);
    json["mtime"] = entry.modifiedTime;
    json["hash"] = entry.contentHash;
    return json;
}

std::optional<CacheEntry> FingerprintCache::fromJson(const Json::Value& json) {
    if (!json.isObject() ||
        !json["size"].isUInt64() ||
        !json["mtime"].isNumeric() ||
        !json["hash"].isString()) {
        return std::nullopt;
    }

    CacheEntry entry;
    entry.size = json["size"].asUInt64();
    entry.modifiedTime = json["mtime"].asDouble();
    entry.contentHash = json["hash"].asString();
    return entry;
}
