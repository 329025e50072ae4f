/**
 * @file FileHasher.hpp
 * @brief Streaming MD5 digests of file contents.
 */

#pragma once
#include <optional>
#include <string>

namespace tidyfile::infrastructure {

class FileHasher {
public:
    /**
     * @brief Lowercase hex MD5 of the whole file.
     * @return Digest, or nullopt if the file cannot be read.
     */
    static std::optional<std::string> Md5Hex(const std::string& path);
};

} // namespace tidyfile::infrastructure
