//
// Created by garrett on 2/24/25.
//

#include "content_fingerprinter.hpp"
#include "logging.hpp"

#include <openssl/sha.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace {

std::string toHex(const unsigned char* digest, size_t length) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < length; i++) {
        ss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return ss.str();
}

} // namespace

std::string ContentFingerprinter::fingerprint(const std::string& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        logging::get()->error("Error calculating hash for {}: {}",
                              logging::displayPath(filePath), std::strerror(errno));
        return "";
    }

    SHA256_CTX sha256Context;
    SHA256_Init(&sha256Context);

    char buffer[CHUNK_SIZE];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        SHA256_Update(&sha256Context, buffer, static_cast<size_t>(file.gcount()));
    }

    // eof sets failbit as well, only badbit marks a failed read
    if (file.bad()) {
        logging::get()->error("Error calculating hash for {}: read failed",
                              logging::displayPath(filePath));
        return "";
    }

    unsigned char result[SHA256_DIGEST_LENGTH];
    SHA256_Final(result, &sha256Context);

    return toHex(result, SHA256_DIGEST_LENGTH);
}
