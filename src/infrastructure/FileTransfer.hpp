/**
 * @file FileTransfer.hpp
 * @brief Copy and move primitives shared by migration, restore and duplicate removal.
 */

#pragma once
#include <filesystem>

namespace tidyfile::infrastructure {

class FileTransfer {
public:
    /**
     * @brief Copies a file without overwriting, keeping its modification time.
     * @throws domain::IOError if the target exists or the copy fails.
     */
    static void Copy(const std::filesystem::path& source, const std::filesystem::path& target);

    /**
     * @brief Renames a file, falling back to copy + remove across filesystems.
     * @throws domain::IOError if the target exists or the move fails.
     */
    static void Move(const std::filesystem::path& source, const std::filesystem::path& target);

    /** @throws domain::IOError if the file cannot be removed. */
    static void Remove(const std::filesystem::path& path);

    static void EnsureParent(const std::filesystem::path& target);
};

} // namespace tidyfile::infrastructure
