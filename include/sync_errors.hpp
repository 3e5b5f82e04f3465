//
// Created by garrett on 3/3/25.
//

#ifndef SYNC_ERRORS_HPP
#define SYNC_ERRORS_HPP

#include <stdexcept>
#include <string>

// Fatal errors raised before a sync run does any work
class SyncError : public std::runtime_error {
public:
    explicit SyncError(const std::string& message) : std::runtime_error(message) {}
};

class InvalidSourceError : public SyncError {
public:
    explicit InvalidSourceError(const std::string& message) : SyncError(message) {}
};

class InvalidDestinationError : public SyncError {
public:
    explicit InvalidDestinationError(const std::string& message) : SyncError(message) {}
};

#endif //SYNC_ERRORS_HPP
