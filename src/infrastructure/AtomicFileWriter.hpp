/**
 * @file AtomicFileWriter.hpp
 * @brief Whole-document reads and temp-file + rename writes.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace tidyfile::infrastructure {

/**
 * @class AtomicFileWriter
 * @brief Replaces a file in one rename so readers never observe a partial document.
 */
class AtomicFileWriter {
public:
    /**
     * @brief Writes content to a unique temp file beside the target, then renames it over the target.
     * @return True if the target now holds exactly the given content.
     */
    static bool Write(const std::filesystem::path& target, const std::string& content);

    /**
     * @brief Reads the whole file.
     * @return Content, or nullopt if the file does not exist.
     * @throws domain::IOError if the file exists but cannot be read.
     */
    static std::optional<std::string> ReadAll(const std::filesystem::path& path);

private:
    static std::filesystem::path MakeTempPath(const std::filesystem::path& target);
};

} // namespace tidyfile::infrastructure
