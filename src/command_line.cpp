//
// Created by garrett on 3/5/25.
//

#include "command_line.hpp"

#include <getopt.h>

#include <sstream>
#include <stdexcept>

namespace {

enum LongOnlyOption {
    OPT_CACHE_FILE = 1000,
    OPT_LOG_FILE
};

const struct option LONG_OPTIONS[] = {
    {"dry-run",    no_argument,       nullptr, 'n'},
    {"verbose",    no_argument,       nullptr, 'v'},
    {"jobs",       required_argument, nullptr, 'j'},
    {"cache-file", required_argument, nullptr, OPT_CACHE_FILE},
    {"log-file",   required_argument, nullptr, OPT_LOG_FILE},
    {"version",    no_argument,       nullptr, 'V'},
    {"help",       no_argument,       nullptr, 'h'},
    {nullptr,      0,                 nullptr, 0}
};

CommandLineResult usageError(const std::string& message) {
    CommandLineResult result;
    result.action = CommandLineResult::Action::ERROR;
    result.message = message;
    return result;
}

// Name of the option getopt just rejected
std::string optionName(char* argv[]) {
    if (optopt != 0 && optopt < OPT_CACHE_FILE) {
        return std::string("-") + static_cast<char>(optopt);
    }
    return argv[optind - 1];
}

} // namespace

std::string usageText(const std::string& program) {
    std::ostringstream ss;
    ss << "Usage: " << program << " [options] SOURCE DESTINATION\n"
       << "\n"
       << "Mirror SOURCE into DESTINATION, copying only new or changed files.\n"
       << "\n"
       << "Options:\n"
       << "  -n, --dry-run          show what would be done without doing it\n"
       << "  -v, --verbose          log every file and disable the progress bar\n"
       << "  -j, --jobs N           hash and copy with N worker threads (default 1)\n"
       << "      --cache-file PATH  fingerprint cache (default " << Configuration::DEFAULT_CACHE_FILE << ")\n"
       << "      --log-file PATH    log file, appended to (default " << Configuration::DEFAULT_LOG_FILE << ")\n"
       << "  -V, --version          print the version and exit\n"
       << "  -h, --help             print this help and exit\n";
    return ss.str();
}

std::string versionText() {
    return std::string("mirrorsync ") + MIRRORSYNC_VERSION;
}

CommandLineResult parseCommandLine(int argc, char* argv[]) {
    CommandLineResult result;
    Configuration& config = result.config;

    // getopt keeps global state, reset it so repeated parses start fresh
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":nvj:Vh", LONG_OPTIONS, nullptr)) != -1) {
        switch (opt) {
            case 'n':
                config.simulate = true;
                break;
            case 'v':
                config.verbose = true;
                break;
            case 'j': {
                std::string value(optarg);
                size_t consumed = 0;
                int jobs = 0;
                try {
                    jobs = std::stoi(value, &consumed);
                } catch (const std::exception&) {
                    return usageError("invalid value for --jobs: " + value);
                }
                if (consumed != value.size() || jobs < 1) {
                    return usageError("invalid value for --jobs: " + value);
                }
                config.num_threads = jobs;
                break;
            }
            case OPT_CACHE_FILE:
                config.cache_file = optarg;
                break;
            case OPT_LOG_FILE:
                config.log_file = optarg;
                break;
            case 'V':
                result.action = CommandLineResult::Action::VERSION;
                return result;
            case 'h':
                result.action = CommandLineResult::Action::HELP;
                return result;
            case ':':
                return usageError("missing argument for " + optionName(argv));
            default:
                return usageError("unrecognized option " + optionName(argv));
        }
    }

    const int positional = argc - optind;
    if (positional < 2) {
        return usageError("SOURCE and DESTINATION are required");
    }
    if (positional > 2) {
        return usageError(std::string("unexpected argument ") + argv[optind + 2]);
    }

    config.source = argv[optind];
    config.destination = argv[optind + 1];
    result.action = CommandLineResult::Action::RUN;
    return result;
}
