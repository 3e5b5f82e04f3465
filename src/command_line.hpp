//
// Created by garrett on 3/5/25.
//

#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include <string>

#include "configuration.hpp"

/// @brief Outcome of parsing the process arguments
struct CommandLineResult {
    enum class Action {
        RUN,
        HELP,
        VERSION,
        ERROR
    };

    Action action{Action::ERROR};
    Configuration config;
    std::string message; // usage error text when action == ERROR
};

/// @brief Parse `mirrorsync [options] SOURCE DESTINATION` into a Configuration
/// @param argc
/// @param argv
/// @return RUN with a filled configuration, or HELP/VERSION/ERROR
CommandLineResult parseCommandLine(int argc, char* argv[]);

std::string usageText(const std::string& program);

std::string versionText();

#endif //COMMAND_LINE_HPP
