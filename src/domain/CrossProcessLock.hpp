/**
 * @file CrossProcessLock.hpp
 * @brief Advisory lock shared by every process that writes the same store.
 */

#pragma once
#include <chrono>
#include <memory>
#include <string>

namespace tidyfile::domain {

class CrossProcessLock {
public:
    virtual ~CrossProcessLock() = default;

    /**
     * @brief Blocks until the lock is held or the timeout expires.
     * @return True if the lock is now held.
     */
    virtual bool lock(std::chrono::milliseconds timeout) = 0;

    virtual void unlock() = 0;

    /** @brief Creates the platform backend for the given lock file path. */
    static std::unique_ptr<CrossProcessLock> Create(const std::string& lockPath);
};

/** @brief Scoped ownership of a CrossProcessLock. */
class CrossProcessLockGuard {
public:
    CrossProcessLockGuard(CrossProcessLock& lock, std::chrono::milliseconds timeout)
        : m_lock(lock), m_owned(lock.lock(timeout)) {}
    ~CrossProcessLockGuard() {
        if (m_owned) m_lock.unlock();
    }
    CrossProcessLockGuard(const CrossProcessLockGuard&) = delete;
    CrossProcessLockGuard& operator=(const CrossProcessLockGuard&) = delete;

    bool owned() const { return m_owned; }

private:
    CrossProcessLock& m_lock;
    bool m_owned;
};

} // namespace tidyfile::domain
