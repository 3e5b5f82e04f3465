//
// Created by garrett on 2/24/25.
//

#ifndef CHANGE_DETECTOR_HPP
#define CHANGE_DETECTOR_HPP

#include <cmath>
#include <optional>

#include "file_record.hpp"

// Decides whether a destination file needs to be replaced by its source
class ChangeDetector {
public:
    // Which comparison rule decided the outcome
    enum class ChangeReason {
        MISSING,           // No destination file
        CONTENT_CHANGED,   // Both hashed, digests differ
        SIZE_CHANGED,      // Hash unavailable, sizes differ
        TIMESTAMP_CHANGED, // Hash unavailable, mtimes further apart than the tolerance
        UNCHANGED
    };

    // Allow a small difference in timestamps for filesystem precision
    static constexpr double MTIME_TOLERANCE_SECONDS = 1.0;

    static ChangeReason classify(const FileRecord& source, const std::optional<FileRecord>& dest) {
        if (!dest) {
            return ChangeReason::MISSING;
        }

        // Hash comparison is authoritative whenever both sides have one
        if (source.hasHash() && dest->hasHash()) {
            return source.contentHash != dest->contentHash ? ChangeReason::CONTENT_CHANGED
                                                           : ChangeReason::UNCHANGED;
        }

        // Fallback to size and modification time
        if (source.size != dest->size) {
            return ChangeReason::SIZE_CHANGED;
        }
        if (std::fabs(source.modifiedTime - dest->modifiedTime) > MTIME_TOLERANCE_SECONDS) {
            return ChangeReason::TIMESTAMP_CHANGED;
        }
        return ChangeReason::UNCHANGED;
    }

    static bool differs(const FileRecord& source, const std::optional<FileRecord>& dest) {
        return classify(source, dest) != ChangeReason::UNCHANGED;
    }

    static const char* describe(ChangeReason reason) {
        switch (reason) {
            case ChangeReason::MISSING:           return "missing in destination";
            case ChangeReason::CONTENT_CHANGED:   return "content changed";
            case ChangeReason::SIZE_CHANGED:      return "size changed";
            case ChangeReason::TIMESTAMP_CHANGED: return "timestamp changed";
            case ChangeReason::UNCHANGED:         return "unchanged";
        }
        return "unknown";
    }
};

#endif //CHANGE_DETECTOR_HPP
