#pragma once
#include "ledger.hpp"
#include <optional>
#include <string>

// Task: PENDING -> IN_PROGRESS -> COMPLETED | FAILED (terminal).
// Pair: BLOCKED -> READY -> COMPLETED (terminal).
bool is_terminal(TaskStatus s);
bool can_transition(TaskStatus from, TaskStatus to);
bool can_transition(PairStatus from, PairStatus to);

// Lowest sequence_index among READY pairs whose pair_lock is off.
TaskPair* find_active_pair(Ledger& ledger);

bool is_claimable_by(const Task& task, const std::string& agent_id);
// First claimable task of the pair, in the pair's list order.
Task* find_claimable_task(const TaskPair& pair, Ledger& ledger, const std::string& agent_id);

// PENDING -> IN_PROGRESS assigned to agent_id. False leaves the task untouched.
bool claim_task(Task& task, const std::string& agent_id);

enum class FinalizeResult {
    Applied,      // status changed, history appended
    AlreadyFinal, // already in the requested terminal status; nothing appended
    Superseded,   // assigned to someone else now; untouched
    Rejected      // not a legal transition; untouched
};
const char* to_string(FinalizeResult r);

FinalizeResult finalize_task(Task& task, TaskStatus final_status, const std::string& agent_id,
                             const std::string& details = {});

// The pair that owns the task: by pair_id, else the pair listing the task.
TaskPair* find_pair_of_task(Ledger& ledger, const Task& task);
// True when the pair references at least one task and all of them exist and are COMPLETED.
bool pair_tasks_completed(const TaskPair& pair, const Ledger& ledger);

// BLOCKED pair with the smallest sequence_index strictly above `after`
// (any BLOCKED pair when `after` is empty). Ties go to list order.
TaskPair* find_next_blocked_pair(Ledger& ledger, std::optional<long long> after);
// BLOCKED -> READY with pair_lock cleared.
bool mark_pair_ready(TaskPair& pair, const std::string& actor, const std::string& details);

struct AdvanceResult {
    bool pair_completed{false};
    TaskPair* next_ready{nullptr};
};

// Barrier step: a READY pair whose tasks are all COMPLETED becomes COMPLETED
// and locked, and the next BLOCKED pair in sequence order becomes READY.
AdvanceResult advance_if_pair_complete(TaskPair& pair, Ledger& ledger, const std::string& actor);
