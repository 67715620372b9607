#include "../include/lock_manager.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <thread>
#include <system_error>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

using json = nlohmann::json;

namespace {
struct FdHandle {
    int fd{-1};
    explicit FdHandle(int f) : fd(f) {}
    ~FdHandle() { if (fd >= 0) ::close(fd); }
    FdHandle(const FdHandle&) = delete;
    FdHandle& operator=(const FdHandle&) = delete;
};

bool write_all(int fd, const std::string& data) {
    const char* ptr = data.data();
    std::size_t size = data.size();
    while (size > 0) {
        ssize_t written = ::write(fd, ptr, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (written == 0) return false;
        ptr += written;
        size -= static_cast<std::size_t>(written);
    }
    return true;
}
}

LockManager::LockManager(std::filesystem::path lock_path, std::string agent_id, Logger log)
    : path_(std::move(lock_path)), agent_id_(std::move(agent_id)), log_(std::move(log)) {}

LockManager::CreateResult LockManager::try_create() {
    FdHandle h(::open(path_.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644));
    if (h.fd < 0) {
        if (errno == EEXIST) return CreateResult::Exists;
        log_.warning("Error creating lock file " + path_.string() + ": " + std::strerror(errno) + ". Retrying...");
        return CreateResult::Failed;
    }
    std::string body = json{{"agent_id", agent_id_}, {"timestamp", now_iso8601()}}.dump();
    if (!write_all(h.fd, body)) {
        log_.warning("Error writing lock file " + path_.string() + ": " + std::strerror(errno) + ". Retrying...");
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        return CreateResult::Failed;
    }
    return CreateResult::Created;
}

std::optional<LockRecord> LockManager::read_record() const {
    auto text = read_text_file(path_);
    if (!text) return std::nullopt;
    try {
        auto j = json::parse(*text);
        if (!j.is_object()) return std::nullopt;
        LockRecord r;
        auto a = j.find("agent_id");
        if (a != j.end() && a->is_string()) r.agent_id = a->get<std::string>();
        auto t = j.find("timestamp");
        if (t != j.end() && t->is_string()) r.timestamp = t->get<std::string>();
        return r;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

bool LockManager::holds_lock() const {
    auto r = read_record();
    return r && r->agent_id == agent_id_;
}

bool LockManager::acquire(std::chrono::milliseconds max_wait, std::chrono::milliseconds retry_interval,
                          std::chrono::seconds stale_timeout) {
    return acquire(LockOptions{max_wait, retry_interval, stale_timeout});
}

bool LockManager::acquire(const LockOptions& opts) {
    const auto start = std::chrono::steady_clock::now();
    do {
        CreateResult cr = try_create();
        if (cr == CreateResult::Created) {
            log_.info("Lock acquired.");
            return true;
        }
        if (cr == CreateResult::Exists) {
            std::error_code ec;
            if (!std::filesystem::exists(path_, ec)) {
                // Released between our create attempt and now.
                continue;
            }
            auto rec = read_record();
            auto acquired_at = rec ? parse_iso8601(rec->timestamp) : std::nullopt;
            if (!acquired_at) {
                log_.warning("Error checking lock file " + path_.string() +
                             ", potentially corrupted. Assuming lock is held.");
            } else if (std::chrono::system_clock::now() - *acquired_at > opts.stale_timeout) {
                log_.warning("Found stale lock from " + rec->agent_id + " (acquired at " +
                             rec->timestamp + "). Breaking it.");
                std::filesystem::remove(path_, ec);
                if (!ec) {
                    log_.info("Stale lock removed. Attempting to acquire again.");
                    continue;
                }
                log_.error("Could not remove stale lock " + path_.string() + ": " + ec.message());
            } else {
                log_.debug("Lock file " + path_.string() + " held by " + rec->agent_id + ". Waiting...");
            }
        }
        std::this_thread::sleep_for(opts.retry_interval);
    } while (std::chrono::steady_clock::now() - start < opts.max_wait);

    log_.warning("Failed to acquire lock within the maximum wait time.");
    return false;
}

void LockManager::release() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        log_.warning("No lock file to release.");
        return;
    }
    auto rec = read_record();
    if (!rec) {
        log_.error("Error releasing lock: " + path_.string() + " is unreadable. Manual check might be needed.");
        return;
    }
    if (rec->agent_id != agent_id_) {
        log_.warning("Attempted to release lock held by " + rec->agent_id + ". Lock not released.");
        return;
    }
    std::filesystem::remove(path_, ec);
    if (ec) {
        log_.error("Error releasing lock: " + ec.message());
        return;
    }
    log_.info("Lock released.");
}
