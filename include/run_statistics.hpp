//
// Created by garrett on 3/3/25.
//

#ifndef RUN_STATISTICS_HPP
#define RUN_STATISTICS_HPP

#include <cstdint>

/// @brief Outcome counters of a single sync run
struct RunStatistics {
    uint64_t filesChecked = 0;
    uint64_t filesCopied = 0;
    uint64_t filesSkipped = 0;
    uint64_t filesExcluded = 0;
    uint64_t directoriesCreated = 0;
    uint64_t bytesCopied = 0;
    uint64_t errors = 0;
};

#endif //RUN_STATISTICS_HPP
