/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of AtomicFileWriter.
 */

#include "infrastructure/AtomicFileWriter.hpp"
#include "domain/Errors.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>

#if defined(_WIN32)
#include <process.h>
#else
#include <unistd.h>
#endif

namespace tidyfile::infrastructure {

namespace fs = std::filesystem;

namespace {

long CurrentProcessId() {
#if defined(_WIN32)
    return static_cast<long>(_getpid());
#else
    return static_cast<long>(::getpid());
#endif
}

std::atomic<unsigned long> g_tempCounter{0};

} // namespace

fs::path AtomicFileWriter::MakeTempPath(const fs::path& target) {
    // filename.<pid>.<timestamp>.<counter>.tmp, unique across threads and processes
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = target;
    tempPath += "." + std::to_string(CurrentProcessId()) + "." + std::to_string(timestamp) + "." +
                std::to_string(g_tempCounter.fetch_add(1)) + ".tmp";
    return tempPath;
}

bool AtomicFileWriter::Write(const fs::path& target, const std::string& content) {
    try {
        if (target.has_parent_path() && !fs::exists(target.parent_path())) {
            fs::create_directories(target.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[AtomicFileWriter] Error creating directories: " << e.what() << std::endl;
        return false;
    }

    fs::path tempPath = MakeTempPath(target);
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[AtomicFileWriter] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[AtomicFileWriter] Write failed during output: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, target, ec);
    if (ec) {
        std::cerr << "[AtomicFileWriter] Rename failed: " << tempPath << " -> " << target
                  << ": " << ec.message() << std::endl;
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        return false;
    }
    return true;
}

std::optional<std::string> AtomicFileWriter::ReadAll(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw domain::IOError("cannot open " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw domain::IOError("read failed for " + path.string());
    }
    return buffer.str();
}

} // namespace tidyfile::infrastructure
