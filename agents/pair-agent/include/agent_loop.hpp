#pragma once
#include "../../../shared/cpp/ledger_sdk/include/ledger_store.hpp"
#include "../../../shared/cpp/ledger_sdk/include/lock_manager.hpp"
#include "../../../shared/cpp/ledger_sdk/include/log.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

// The external work for a claimed task. Returns COMPLETED or FAILED; a thrown
// exception is recorded as FAILED.
using WorkFn = std::function<TaskStatus(const Task&)>;

enum class CycleOutcome {
    LockUnavailable,     // contention, nothing done
    LedgerUnreadable,    // missing/corrupt ledger, nothing written
    NoActivePair,
    NoClaimableTask,
    ClaimNotRecorded,    // claim write failed, work not started
    Finalized,
    Superseded,          // task reassigned during work, result discarded
    TaskMissing,         // task vanished during work
    FinalizeRejected,    // task no longer in a state that accepts the result
    FinalizeLockLost,    // work done but the lock could not be re-acquired
    FinalizeNotRecorded, // work done but the final write failed
    Error
};
const char* to_string(CycleOutcome o);

struct CycleResult {
    bool worked{false};
    CycleOutcome outcome{CycleOutcome::Error};
    std::string task_id;
    std::optional<TaskStatus> final_status;
};

class PairAgent {
public:
    // The agent id is the lock holder id; store and lock outlive the agent.
    PairAgent(LedgerStore& store, LockManager& lock, LockOptions lock_opts, WorkFn work);
    PairAgent(LedgerStore& store, LockManager& lock, LockOptions lock_opts, WorkFn work, Logger log);

    // Claim one task of the active pair, release the lock, run the work,
    // re-acquire and record the outcome, then advance the barrier.
    CycleResult run_cycle();
    // Runs `cycles` cycles (forever when empty), sleeping `interval` between
    // them. Returns the number of cycles that did work.
    std::size_t run(std::optional<std::size_t> cycles, std::chrono::milliseconds interval);

    const std::string& agent_id() const { return agent_id_; }

private:
    void finalize(CycleResult& result, const std::string& details, const std::string& claim_fingerprint);

    LedgerStore& store_;
    LockManager& lock_;
    LockOptions lock_opts_;
    WorkFn work_;
    std::string agent_id_;
    Logger log_;
};
