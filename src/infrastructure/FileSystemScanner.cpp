/**
 * @file FileSystemScanner.cpp
 * @brief Implementation of the FileSystemScanner.
 */

#include "infrastructure/FileSystemScanner.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <sys/stat.h>
#include <sys/types.h>

namespace fs = std::filesystem;

namespace tidyfile::infrastructure {

namespace {

bool IsHidden(const fs::path& p) {
    std::string name = p.filename().string();
    return !name.empty() && name[0] == '.';
}

} // namespace

std::vector<domain::FileRecord> FileSystemScanner::scan(const std::vector<std::string>& directories) const {
    std::vector<domain::FileRecord> records;

    for (const auto& dir : directories) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            std::cerr << "[FileSystemScanner] Skipping missing directory: " << dir << std::endl;
            continue;
        }

        fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            std::cerr << "[FileSystemScanner] Cannot read " << dir << ": " << ec.message() << std::endl;
            continue;
        }
        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                std::cerr << "[FileSystemScanner] Walk error in " << dir << ": " << ec.message() << std::endl;
                break;
            }
            const auto& entry = *it;
            if (IsHidden(entry.path())) {
                if (entry.is_directory(ec)) it.disable_recursion_pending();
                continue;
            }
            if (!entry.is_regular_file(ec)) {
                continue;
            }
            auto record = Capture(fs::absolute(entry.path()).lexically_normal().string());
            if (record) {
                records.push_back(std::move(*record));
            }
        }
    }

    std::sort(records.begin(), records.end(),
              [](const domain::FileRecord& a, const domain::FileRecord& b) { return a.path < b.path; });
    records.erase(std::unique(records.begin(), records.end(),
                              [](const domain::FileRecord& a, const domain::FileRecord& b) { return a.path == b.path; }),
                  records.end());

    std::cout << "[FileSystemScanner] Found " << records.size() << " files" << std::endl;
    return records;
}

std::optional<domain::FileRecord> FileSystemScanner::Capture(const std::string& path) {
#if defined(_WIN32)
    struct _stat64 st{};
    if (_stat64(path.c_str(), &st) != 0 || (st.st_mode & _S_IFREG) == 0) {
        return std::nullopt;
    }
#else
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return std::nullopt;
    }
#endif

    fs::path p(path);
    domain::FileRecord record;
    record.path = path;
    record.name = p.filename().string();
    record.extension = p.extension().string();
    std::transform(record.extension.begin(), record.extension.end(), record.extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    record.sizeBytes = static_cast<std::uintmax_t>(st.st_size);
    // st_ctime is the closest portable notion of creation time on POSIX.
    record.created = std::chrono::system_clock::from_time_t(st.st_ctime);
    record.modified = std::chrono::system_clock::from_time_t(st.st_mtime);
    return record;
}

std::vector<std::string> FileSystemScanner::ListSubdirectories(const std::string& directory) {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "[FileSystemScanner] Cannot list " << directory << ": " << ec.message() << std::endl;
        return names;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (it->is_directory(ec) && !IsHidden(it->path())) {
            names.push_back(it->path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace tidyfile::infrastructure
