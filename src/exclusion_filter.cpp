//
// Created by garrett on 3/3/25.
//

#include "exclusion_filter.hpp"

ExclusionFilter::ExclusionFilter() : m_names(defaultNames()) {
}

ExclusionFilter::ExclusionFilter(std::unordered_set<std::string> names) : m_names(std::move(names)) {
}

bool ExclusionFilter::isExcludedName(const std::string& name) const {
    return m_names.count(name) > 0;
}

bool ExclusionFilter::isExcluded(const fs::path& relativePath) const {
    for (const auto& part : relativePath) {
        if (isExcludedName(part.string())) {
            return true;
        }
    }
    return false;
}

const std::unordered_set<std::string>& ExclusionFilter::defaultNames() {
    static const std::unordered_set<std::string> names = {
        ".DS_Store",
        "__MACOSX",
        ".AppleDouble",
        ".LSOverride",
        ".Spotlight-V100",
        ".Trashes",
        ".fseventsd"
    };
    return names;
}
