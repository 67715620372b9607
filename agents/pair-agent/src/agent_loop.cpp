#include "../include/agent_loop.hpp"
#include "../../../shared/cpp/ledger_sdk/include/pair_state.hpp"
#include <thread>
#include <stdexcept>

const char* to_string(CycleOutcome o) {
    switch (o) {
        case CycleOutcome::LockUnavailable: return "lock-unavailable";
        case CycleOutcome::LedgerUnreadable: return "ledger-unreadable";
        case CycleOutcome::NoActivePair: return "no-active-pair";
        case CycleOutcome::NoClaimableTask: return "no-claimable-task";
        case CycleOutcome::ClaimNotRecorded: return "claim-not-recorded";
        case CycleOutcome::Finalized: return "finalized";
        case CycleOutcome::Superseded: return "superseded";
        case CycleOutcome::TaskMissing: return "task-missing";
        case CycleOutcome::FinalizeRejected: return "finalize-rejected";
        case CycleOutcome::FinalizeLockLost: return "finalize-lock-lost";
        case CycleOutcome::FinalizeNotRecorded: return "finalize-not-recorded";
        case CycleOutcome::Error: return "error";
    }
    return "error";
}

PairAgent::PairAgent(LedgerStore& store, LockManager& lock, LockOptions lock_opts, WorkFn work)
    : PairAgent(store, lock, lock_opts, std::move(work), Logger(lock.agent_id())) {}

PairAgent::PairAgent(LedgerStore& store, LockManager& lock, LockOptions lock_opts, WorkFn work, Logger log)
    : store_(store), lock_(lock), lock_opts_(lock_opts), work_(std::move(work)),
      agent_id_(lock.agent_id()), log_(std::move(log)) {
    if (!work_) throw std::invalid_argument("PairAgent requires a work function");
}

CycleResult PairAgent::run_cycle() {
    CycleResult result;
    Task claimed;
    std::string claim_fingerprint;
    log_.info("Attempting to process tasks...");

    {
        ScopedLock guard(lock_, lock_opts_);
        if (!guard) {
            log_.warning("Could not acquire lock. Will retry later.");
            result.outcome = CycleOutcome::LockUnavailable;
            return result;
        }
        try {
            auto ledger = store_.read();
            if (!ledger) {
                log_.warning("Task data could not be read.");
                result.outcome = CycleOutcome::LedgerUnreadable;
                return result;
            }

            TaskPair* active = find_active_pair(*ledger);
            if (!active) {
                log_.info("No READY and unlocked task pairs found.");
                result.outcome = CycleOutcome::NoActivePair;
                return result;
            }
            log_.info("Found active pair: " + active->pair_id + " (Seq: " +
                      std::to_string(active->sequence_index) + ")");
            for (const auto& id : active->tasks) {
                if (!ledger->find_task(id)) {
                    log_.error("Task ID '" + id + "' in pair '" + active->pair_id +
                               "' not found in tasks list. Skipping.");
                }
            }

            Task* task = find_claimable_task(*active, *ledger, agent_id_);
            if (!task || !claim_task(*task, agent_id_)) {
                log_.info("No suitable PENDING tasks found for this agent in the active pair.");
                result.outcome = CycleOutcome::NoClaimableTask;
                return result;
            }
            claimed = *task;
            if (!store_.write(*ledger)) {
                log_.error("Could not record claim of task '" + claimed.id + "'. Work not started.");
                result.outcome = CycleOutcome::ClaimNotRecorded;
                return result;
            }
            claim_fingerprint = store_.fingerprint();
            log_.info("Task '" + claimed.id + "' claimed and status set to IN_PROGRESS.");
        } catch (const std::exception& e) {
            log_.error(std::string("Error during task processing: ") + e.what());
            result.outcome = CycleOutcome::Error;
            return result;
        } catch (...) {
            log_.error("Unknown error during task processing.");
            result.outcome = CycleOutcome::Error;
            return result;
        }
        // Work time is unbounded; other agents may claim meanwhile.
        guard.release();
        log_.info("Lock released before performing work for task '" + claimed.id + "'.");
    }

    result.task_id = claimed.id;
    result.worked = true;
    TaskStatus final_status = TaskStatus::Failed;
    std::string details;
    try {
        final_status = work_(claimed);
    } catch (const std::exception& e) {
        log_.error("Work on task '" + claimed.id + "' raised: " + e.what());
        final_status = TaskStatus::Failed;
        details = std::string("work raised: ") + e.what();
    } catch (...) {
        log_.error("Work on task '" + claimed.id + "' raised an unknown exception.");
        final_status = TaskStatus::Failed;
        details = "work raised an unknown exception";
    }
    if (!is_terminal(final_status)) {
        log_.error(std::string("Work on task '") + claimed.id + "' returned " + to_string(final_status) +
                   ". Recording FAILED.");
        details = std::string("work returned ") + to_string(final_status);
        final_status = TaskStatus::Failed;
    }
    result.final_status = final_status;

    finalize(result, details, claim_fingerprint);
    return result;
}

void PairAgent::finalize(CycleResult& result, const std::string& details, const std::string& claim_fingerprint) {
    const std::string& id = result.task_id;
    const char* status_name = to_string(*result.final_status);

    ScopedLock guard(lock_, lock_opts_);
    if (!guard) {
        log_.critical("Could not re-acquire lock to finalize task '" + id + "'. Status: " + status_name +
                      ". Manual intervention may be needed.");
        result.outcome = CycleOutcome::FinalizeLockLost;
        return;
    }

    try {
        auto ledger = store_.read();
        if (!ledger) {
            log_.critical("Could not read ledger to finalize task '" + id + "'. Status: " + status_name + ".");
            result.outcome = CycleOutcome::LedgerUnreadable;
            return;
        }
        if (store_.fingerprint() != claim_fingerprint) {
            log_.info("Ledger was modified by another process while task '" + id + "' was worked on.");
        }

        Task* task = ledger->find_task(id);
        if (!task) {
            log_.error("Task '" + id + "' no longer found in data file upon trying to finalize.");
            result.outcome = CycleOutcome::TaskMissing;
            return;
        }

        FinalizeResult fr = finalize_task(*task, *result.final_status, agent_id_, details);
        if (fr == FinalizeResult::Superseded) {
            log_.warning("Task '" + id + "' was reassigned from " + agent_id_ + " to " +
                         task->assigned_to.value_or("nobody") + " before finalization. Not updating.");
            result.outcome = CycleOutcome::Superseded;
            return;
        }
        if (fr == FinalizeResult::Rejected) {
            log_.error("Task '" + id + "' is " + to_string(task->status) + "; cannot record " + status_name + ".");
            result.outcome = CycleOutcome::FinalizeRejected;
            return;
        }
        bool changed = fr == FinalizeResult::Applied;
        if (changed) {
            log_.info("Task '" + id + "' finalized with status '" + status_name + "'.");
        } else {
            log_.warning("Task '" + id + "' was already " + status_name + ". No history added.");
        }

        if (TaskPair* pair = find_pair_of_task(*ledger, *task)) {
            AdvanceResult adv = advance_if_pair_complete(*pair, *ledger, agent_id_);
            if (adv.pair_completed) {
                changed = true;
                log_.info("All tasks in pair '" + pair->pair_id + "' are COMPLETED.");
                if (adv.next_ready) {
                    log_.info("Advancing next pair: '" + adv.next_ready->pair_id + "' (Seq: " +
                              std::to_string(adv.next_ready->sequence_index) + ") to READY.");
                } else {
                    log_.info("No BLOCKED pair follows '" + pair->pair_id + "'. Pipeline has no more ready work.");
                }
            }
        } else {
            log_.error("Task '" + id + "' has no pair in the ledger. Barrier not evaluated.");
        }

        if (changed && !store_.write(*ledger)) {
            log_.critical("Could not write final status " + std::string(status_name) + " of task '" + id +
                          "'. Manual intervention may be needed.");
            result.outcome = CycleOutcome::FinalizeNotRecorded;
            return;
        }
        result.outcome = CycleOutcome::Finalized;
    } catch (const std::exception& e) {
        log_.critical("Error during task finalization for '" + id + "': " + e.what());
        result.outcome = CycleOutcome::Error;
    } catch (...) {
        log_.critical("Unknown error during task finalization for '" + id + "'.");
        result.outcome = CycleOutcome::Error;
    }
}

std::size_t PairAgent::run(std::optional<std::size_t> cycles, std::chrono::milliseconds interval) {
    log_.info("Starting run loop. Max cycles: " + (cycles ? std::to_string(*cycles) : std::string("infinite")) +
              ". Interval: " + std::to_string(interval.count()) + "ms.");
    std::size_t executed = 0;
    std::size_t worked = 0;
    while (!cycles || executed < *cycles) {
        try {
            CycleResult r = run_cycle();
            if (r.worked) {
                ++worked;
                log_.info("Cycle " + std::to_string(executed + 1) + ": Task '" + r.task_id + "' processed (" +
                          to_string(r.outcome) + ").");
            } else {
                log_.info("Cycle " + std::to_string(executed + 1) + ": No tasks processed or available for this agent (" +
                          to_string(r.outcome) + ").");
            }
        } catch (const std::exception& e) {
            log_.critical(std::string("Unhandled error in agent run loop: ") + e.what());
        } catch (...) {
            log_.critical("Unhandled unknown error in agent run loop.");
        }

        ++executed;
        if (cycles && executed >= *cycles) break;
        log_.debug("Waiting " + std::to_string(interval.count()) + "ms for next cycle...");
        std::this_thread::sleep_for(interval);
    }
    log_.info("Run loop finished.");
    return worked;
}
