// main file for directory mirroring
// Created by: Garrett Madsen


#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>


#include "command_line.hpp"
#include "configuration.hpp"
#include "console_reporter.hpp"
#include "logging.hpp"
#include "sync_manager.hpp"

std::atomic<bool> interrupted(false);

extern "C" void signalHandler(int) {
    interrupted = true;
}

int main(int argc, char* argv[]) {
    CommandLineResult parsed = parseCommandLine(argc, argv);

    switch (parsed.action) {
        case CommandLineResult::Action::HELP:
            std::cout << usageText(argv[0]);
            return 0;
        case CommandLineResult::Action::VERSION:
            std::cout << versionText() << std::endl;
            return 0;
        case CommandLineResult::Action::ERROR:
            std::cerr << "Error: " << parsed.message << "\n\n" << usageText(argv[0]);
            return 1;
        case CommandLineResult::Action::RUN:
            break;
    }

    auto config = std::make_shared<Configuration>(parsed.config);

    // Graceful shutdown handling, stops after the files in flight
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        logging::init(config->log_file, config->verbose);

        ConsoleReporter::Options options;
        options.source = config->source;
        options.destination = config->destination;
        options.logFile = config->log_file;
        options.simulate = config->simulate;
        options.showProgress = !config->verbose;
        auto reporter = std::make_shared<ConsoleReporter>(options);

        SyncManager sync_manager{config, reporter};
        sync_manager.setInterruptFlag(&interrupted);

        std::cout << "Counting files..." << std::endl;
        SyncReport report = sync_manager.run();

        if (report.interrupted) {
            std::cout << "\nOperation cancelled by user." << std::endl;
            logging::shutdown();
            return 1;
        }
    } catch (const std::exception& e) {
        // InvalidSourceError and friends end up here as well as anything unexpected
        std::cerr << "Error: " << e.what() << std::endl;
        logging::shutdown();
        return 1;
    }

    logging::shutdown();
    return 0;
}
