//
// Created by garrett on 2/24/25.
//

#ifndef CONTENT_FINGERPRINTER_HPP
#define CONTENT_FINGERPRINTER_HPP

#include <cstddef>
#include <string>

// Computes content hashes for files
class ContentFingerprinter {
public:
    static constexpr size_t CHUNK_SIZE = 8192;
    static constexpr size_t DIGEST_HEX_LENGTH = 64;

    /// @brief SHA-256 of the file's content, streamed in CHUNK_SIZE blocks
    /// @param filePath
    /// @return lower-case hex digest, or an empty string if the file could not be read
    static std::string fingerprint(const std::string& filePath);
};

#endif //CONTENT_FINGERPRINTER_HPP
