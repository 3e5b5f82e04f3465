//
// Created by garrett on 2/23/25.
//

#ifndef CONFIGURATION_HPP
#define CONFIGURATION_HPP

#include <string>

#ifndef MIRRORSYNC_VERSION
#define MIRRORSYNC_VERSION "1.0.0"
#endif

class Configuration {
public:

    Configuration();

    std::string source;      // directory to mirror from
    std::string destination; // directory to mirror into

    bool simulate{false}; // report actions without touching the destination
    bool verbose{false};  // per-file debug logging, no progress bar

    int num_threads{1}; // number of threads to use for synchronization

    std::string cache_file; // persisted fingerprint cache
    std::string log_file;   // append-mode log file

    static constexpr const char* DEFAULT_CACHE_FILE = ".mirrorsync_cache.json";
    static constexpr const char* DEFAULT_LOG_FILE = "mirrorsync.log";
};

#endif //CONFIGURATION_HPP
