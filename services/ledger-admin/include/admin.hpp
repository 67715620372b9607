#pragma once
#include "../../../shared/cpp/ledger_sdk/include/ledger_store.hpp"
#include "../../../shared/cpp/ledger_sdk/include/lock_manager.hpp"
#include "../../../shared/cpp/ledger_sdk/include/log.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct AdminResult {
    bool ok{true};
    bool changed{false}; // ledger must be written
    std::string message;
    std::vector<std::string> warnings;
    std::string id;      // id of the created task/pair, if any
};

struct NewTask {
    std::string description;
    std::optional<std::string> agent_preference;
    std::optional<std::string> pair_id;
    std::optional<std::string> task_id; // generated when empty
};

struct NewPair {
    std::string task_id1;
    std::string task_id2;
    long long sequence_index{0};
    std::optional<std::string> pair_id; // "pair_<id>" when empty
    PairStatus status{PairStatus::Blocked};
    std::optional<bool> pair_lock;      // defaults to status == BLOCKED
};

struct NewFullPair {
    std::string description1;
    std::optional<std::string> agent1;
    std::string description2;
    std::optional<std::string> agent2;
    long long sequence_index{0};
    std::optional<std::string> prefix; // ids become <prefix>_t1, <prefix>_t2, <prefix>_p
};

struct ValidationReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::string fingerprint;
    bool ok() const { return errors.empty(); }
};

// Bootstrap and inspection commands over the same ledger and lock files the
// agents use. Mutating commands run under the lock; status and validate
// only read.
class LedgerAdmin {
public:
    LedgerAdmin(LedgerStore& store, LockManager& lock, LockOptions lock_opts, Logger log);

    AdminResult init(bool force);
    AdminResult add_task(const NewTask& spec);
    AdminResult add_pair(const NewPair& spec);
    AdminResult create_full_pair(const NewFullPair& spec);
    // Unlocks the next BLOCKED pair after the highest COMPLETED one, or with
    // force the lowest BLOCKED pair overall.
    AdminResult advance_next_pair(bool force);

    // Whole document, {"pair", "associated_tasks"}, {"task"} or {"error"}.
    // nullopt when the ledger cannot be read.
    std::optional<nlohmann::json> status(const std::optional<std::string>& pair_id,
                                         const std::optional<std::string>& task_id) const;
    ValidationReport validate() const;

    const std::string& actor() const { return lock_.agent_id(); }

private:
    AdminResult mutate(const std::function<AdminResult(Ledger&)>& fn);

    LedgerStore& store_;
    LockManager& lock_;
    LockOptions lock_opts_;
    Logger log_;
};
