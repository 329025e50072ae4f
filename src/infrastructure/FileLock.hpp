/**
 * @file FileLock.hpp
 * @brief Platform backends of domain::CrossProcessLock over a sibling lock file.
 */

#pragma once
#include <string>
#include "domain/CrossProcessLock.hpp"

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace tidyfile::infrastructure {

#if defined(_WIN32)

/** @brief LockFileEx on a dedicated lock file. */
class WindowsFileLock : public domain::CrossProcessLock {
public:
    explicit WindowsFileLock(std::string lockPath);
    ~WindowsFileLock() override;

    bool lock(std::chrono::milliseconds timeout) override;
    void unlock() override;

private:
    std::string m_lockPath;
    HANDLE m_handle = INVALID_HANDLE_VALUE;
    bool m_held = false;
};

#else

/**
 * @brief flock(LOCK_EX) on a dedicated lock file.
 *
 * The lock file is never replaced, so the lock survives the temp-file
 * renames performed on the protected document.
 */
class PosixFileLock : public domain::CrossProcessLock {
public:
    explicit PosixFileLock(std::string lockPath);
    ~PosixFileLock() override;

    bool lock(std::chrono::milliseconds timeout) override;
    void unlock() override;

private:
    std::string m_lockPath;
    int m_fd = -1;
    bool m_held = false;
};

#endif

} // namespace tidyfile::infrastructure
