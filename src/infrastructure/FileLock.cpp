/**
 * @file FileLock.cpp
 * @brief Implementation of the advisory lock file backends.
 */

#include "infrastructure/FileLock.hpp"
#include <chrono>
#include <iostream>
#include <thread>

#if !defined(_WIN32)
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace tidyfile {

namespace infrastructure {

namespace {
constexpr std::chrono::milliseconds kRetryInterval{10};
}

#if defined(_WIN32)

WindowsFileLock::WindowsFileLock(std::string lockPath) : m_lockPath(std::move(lockPath)) {}

WindowsFileLock::~WindowsFileLock() {
    unlock();
    if (m_handle != INVALID_HANDLE_VALUE) {
        CloseHandle(m_handle);
    }
}

bool WindowsFileLock::lock(std::chrono::milliseconds timeout) {
    if (m_held) return true;
    if (m_handle == INVALID_HANDLE_VALUE) {
        m_handle = CreateFileA(m_lockPath.c_str(), GENERIC_READ | GENERIC_WRITE,
                               FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                               nullptr, OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (m_handle == INVALID_HANDLE_VALUE) {
            std::cerr << "[FileLock] Cannot open lock file " << m_lockPath
                      << " (error " << GetLastError() << ")" << std::endl;
            return false;
        }
    }

    auto until = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        OVERLAPPED overlapped{};
        if (LockFileEx(m_handle, LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY, 0,
                       MAXDWORD, MAXDWORD, &overlapped)) {
            m_held = true;
            return true;
        }
        DWORD err = GetLastError();
        if (err != ERROR_LOCK_VIOLATION && err != ERROR_IO_PENDING) {
            std::cerr << "[FileLock] LockFileEx failed on " << m_lockPath
                      << " (error " << err << ")" << std::endl;
            return false;
        }
        if (std::chrono::steady_clock::now() >= until) {
            std::cerr << "[FileLock] Timed out waiting for " << m_lockPath << std::endl;
            return false;
        }
        std::this_thread::sleep_for(kRetryInterval);
    }
}

void WindowsFileLock::unlock() {
    if (!m_held) return;
    OVERLAPPED overlapped{};
    UnlockFileEx(m_handle, 0, MAXDWORD, MAXDWORD, &overlapped);
    m_held = false;
}

#else

PosixFileLock::PosixFileLock(std::string lockPath) : m_lockPath(std::move(lockPath)) {}

PosixFileLock::~PosixFileLock() {
    unlock();
    if (m_fd >= 0) {
        ::close(m_fd);
    }
}

bool PosixFileLock::lock(std::chrono::milliseconds timeout) {
    if (m_held) return true;
    if (m_fd < 0) {
        m_fd = ::open(m_lockPath.c_str(), O_CREAT | O_CLOEXEC | O_RDWR, 0600);
        if (m_fd < 0) {
            std::cerr << "[FileLock] Cannot open lock file " << m_lockPath << ": "
                      << std::strerror(errno) << std::endl;
            return false;
        }
    }

    auto until = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (::flock(m_fd, LOCK_EX | LOCK_NB) == 0) {
            m_held = true;
            return true;
        }
        int e = errno;
        if (e != EWOULDBLOCK && e != EAGAIN && e != EINTR) {
            std::cerr << "[FileLock] flock failed on " << m_lockPath << ": "
                      << std::strerror(e) << std::endl;
            return false;
        }
        if (std::chrono::steady_clock::now() >= until) {
            std::cerr << "[FileLock] Timed out waiting for " << m_lockPath << std::endl;
            return false;
        }
        std::this_thread::sleep_for(kRetryInterval);
    }
}

void PosixFileLock::unlock() {
    if (!m_held) return;
    ::flock(m_fd, LOCK_UN);
    m_held = false;
}

#endif

} // namespace infrastructure

namespace domain {

std::unique_ptr<CrossProcessLock> CrossProcessLock::Create(const std::string& lockPath) {
#if defined(_WIN32)
    return std::make_unique<infrastructure::WindowsFileLock>(lockPath);
#else
    return std::make_unique<infrastructure::PosixFileLock>(lockPath);
#endif
}

} // namespace domain

} // namespace tidyfile
