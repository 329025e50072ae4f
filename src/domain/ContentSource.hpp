/**
 * @file ContentSource.hpp
 * @brief Interface for best-effort bounded text extraction.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace tidyfile::domain {

class ContentSource {
public:
    virtual ~ContentSource() = default;

    /**
     * @brief Extracts at most maxLength bytes of text from the file.
     * @return Text prefix, or nullopt when the format is unsupported or extraction failed.
     */
    virtual std::optional<std::string> extract(const std::string& path, std::size_t maxLength) = 0;
};

} // namespace tidyfile::domain
