#pragma once
#include "log.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

struct LockOptions {
    std::chrono::milliseconds max_wait{60000};
    std::chrono::milliseconds retry_interval{5000};
    std::chrono::seconds stale_timeout{300};
};

// Contents of the lock file: {"agent_id": ..., "timestamp": ISO-8601}.
struct LockRecord {
    std::string agent_id;
    std::string timestamp;
};

// Advisory lock over a shared file. The lock is held while the lock file
// exists; it is created with O_CREAT|O_EXCL so only one creator wins.
// A lock older than the stale timeout is presumed abandoned and removed.
class LockManager {
public:
    LockManager(std::filesystem::path lock_path, std::string agent_id,
                Logger log = Logger("lock"));

    // Polls until max_wait elapses. False is the normal outcome under
    // contention and never grants permission to touch the ledger.
    bool acquire(const LockOptions& opts);
    bool acquire(std::chrono::milliseconds max_wait, std::chrono::milliseconds retry_interval,
                 std::chrono::seconds stale_timeout);

    // Deletes the lock file only when it names this agent as holder.
    void release();

    // nullopt when the file is missing, unreadable or not a lock record.
    std::optional<LockRecord> read_record() const;
    bool holds_lock() const;

    const std::string& agent_id() const { return agent_id_; }
    const std::filesystem::path& path() const { return path_; }

private:
    enum class CreateResult { Created, Exists, Failed };
    CreateResult try_create();

    std::filesystem::path path_;
    std::string agent_id_;
    Logger log_;
};

// Releases on scope exit, so every exit path of a read-mutate-write span
// gives the lock back.
class ScopedLock {
public:
    ScopedLock(LockManager& mgr, const LockOptions& opts)
        : mgr_(mgr), held_(mgr.acquire(opts)) {}
    ~ScopedLock() { release(); }
    ScopedLock(const ScopedLock&) = delete;
    ScopedLock& operator=(const ScopedLock&) = delete;

    bool owns_lock() const { return held_; }
    explicit operator bool() const { return held_; }

    void release() {
        if (!held_) return;
        held_ = false;
        mgr_.release();
    }

private:
    LockManager& mgr_;
    bool held_;
};
