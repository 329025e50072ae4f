#include "infrastructure/FileTransfer.hpp"
#include "domain/Errors.hpp"
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace tidyfile::infrastructure {

void FileTransfer::EnsureParent(const fs::path& target) {
    if (!target.has_parent_path()) return;
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw domain::IOError("cannot create " + target.parent_path().string() + ": " + ec.message());
    }
}

void FileTransfer::Copy(const fs::path& source, const fs::path& target) {
    std::error_code ec;
    if (fs::exists(target, ec)) {
        throw domain::IOError("target already exists: " + target.string());
    }
    EnsureParent(target);

    // copy_options::none fails instead of overwriting.
    if (!fs::copy_file(source, target, fs::copy_options::none, ec) || ec) {
        throw domain::IOError("copy " + source.string() + " -> " + target.string() + " failed: " + ec.message());
    }

    auto mtime = fs::last_write_time(source, ec);
    if (!ec) {
        fs::last_write_time(target, mtime, ec);
    }
    if (ec) {
        std::cerr << "[FileTransfer] Could not preserve modification time of " << target
                  << ": " << ec.message() << std::endl;
    }
}

void FileTransfer::Move(const fs::path& source, const fs::path& target) {
    std::error_code ec;
    if (fs::exists(target, ec)) {
        throw domain::IOError("target already exists: " + target.string());
    }
    EnsureParent(target);

    fs::rename(source, target, ec);
    if (!ec) return;

    if (ec != std::errc::cross_device_link) {
        throw domain::IOError("move " + source.string() + " -> " + target.string() + " failed: " + ec.message());
    }

    Copy(source, target);
    fs::remove(source, ec);
    if (ec) {
        // Leave the source in place rather than lose the only complete copy.
        std::error_code cleanup;
        fs::remove(target, cleanup);
        throw domain::IOError("move " + source.string() + ": cannot remove source: " + ec.message());
    }
}

void FileTransfer::Remove(const fs::path& path) {
    std::error_code ec;
    if (!fs::remove(path, ec) || ec) {
        throw domain::IOError("cannot remove " + path.string() + (ec ? ": " + ec.message() : ""));
    }
}

} // namespace tidyfile::infrastructure
