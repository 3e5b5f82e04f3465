//
// Created by garrett on 3/3/25.
//

#ifndef EXCLUSION_FILTER_HPP
#define EXCLUSION_FILTER_HPP

#include <filesystem>
#include <string>
#include <unordered_set>

namespace fs = std::filesystem;

/// Skips platform metadata (Finder, Spotlight, Trash, resource forks) by exact name.
/// Names are literals, never patterns.
class ExclusionFilter {
public:
    ExclusionFilter();
    explicit ExclusionFilter(std::unordered_set<std::string> names);

    /// @brief True if a single file or directory name is excluded
    bool isExcludedName(const std::string& name) const;

    /// @brief True if any component of a path relative to the source root is excluded
    bool isExcluded(const fs::path& relativePath) const;

    const std::unordered_set<std::string>& names() const { return m_names; }

    static const std::unordered_set<std::string>& defaultNames();

private:
    const std::unordered_set<std::string> m_names;
};

#endif //EXCLUSION_FILTER_HPP
