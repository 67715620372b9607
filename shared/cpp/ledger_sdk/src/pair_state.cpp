#include "../include/pair_state.hpp"
#include <algorithm>

bool is_terminal(TaskStatus s) {
    return s == TaskStatus::Completed || s == TaskStatus::Failed;
}

bool can_transition(TaskStatus from, TaskStatus to) {
    switch (from) {
        case TaskStatus::Pending: return to == TaskStatus::InProgress;
        case TaskStatus::InProgress: return is_terminal(to);
        case TaskStatus::Completed:
        case TaskStatus::Failed: return false;
    }
    return false;
}

bool can_transition(PairStatus from, PairStatus to) {
    return (from == PairStatus::Blocked && to == PairStatus::Ready) ||
           (from == PairStatus::Ready && to == PairStatus::Completed);
}

TaskPair* find_active_pair(Ledger& ledger) {
    TaskPair* best = nullptr;
    for (auto& p : ledger.task_pairs) {
        if (p.status != PairStatus::Ready || p.pair_lock) continue;
        if (!best || p.sequence_index < best->sequence_index) best = &p;
    }
    return best;
}

bool is_claimable_by(const Task& task, const std::string& agent_id) {
    if (task.status != TaskStatus::Pending) return false;
    if (task.assigned_to && !task.assigned_to->empty()) return false;
    return !task.agent_preference || task.agent_preference->empty() || *task.agent_preference == agent_id;
}

Task* find_claimable_task(const TaskPair& pair, Ledger& ledger, const std::string& agent_id) {
    for (const auto& id : pair.tasks) {
        Task* t = ledger.find_task(id);
        if (t && is_claimable_by(*t, agent_id)) return t;
    }
    return nullptr;
}

bool claim_task(Task& task, const std::string& agent_id) {
    if (agent_id.empty()) return false;
    if (task.assigned_to && !task.assigned_to->empty()) return false;
    if (!can_transition(task.status, TaskStatus::InProgress)) return false;
    task.status = TaskStatus::InProgress;
    task.assigned_to = agent_id;
    append_history(task, kEventAssigned, agent_id, "Assigned to and claimed by " + agent_id);
    return true;
}

const char* to_string(FinalizeResult r) {
    switch (r) {
        case FinalizeResult::Applied: return "applied";
        case FinalizeResult::AlreadyFinal: return "already-final";
        case FinalizeResult::Superseded: return "superseded";
        case FinalizeResult::Rejected: return "rejected";
    }
    return "rejected";
}

FinalizeResult finalize_task(Task& task, TaskStatus final_status, const std::string& agent_id,
                             const std::string& details) {
    if (task.assigned_to.value_or("") != agent_id) return FinalizeResult::Superseded;
    if (!is_terminal(final_status)) return FinalizeResult::Rejected;
    if (task.status == final_status) return FinalizeResult::AlreadyFinal;
    if (!can_transition(task.status, final_status)) return FinalizeResult::Rejected;

    TaskStatus old = task.status;
    task.status = final_status;
    std::string msg = std::string("Status changed from ") + to_string(old) + " to " +
                      to_string(final_status) + " by " + agent_id;
    if (!details.empty()) msg += ": " + details;
    append_history(task, kEventStatusChanged, agent_id, msg);
    return FinalizeResult::Applied;
}

TaskPair* find_pair_of_task(Ledger& ledger, const Task& task) {
    if (task.pair_id) return ledger.find_pair(*task.pair_id);
    for (auto& p : ledger.task_pairs) {
        if (std::find(p.tasks.begin(), p.tasks.end(), task.id) != p.tasks.end()) return &p;
    }
    return nullptr;
}

bool pair_tasks_completed(const TaskPair& pair, const Ledger& ledger) {
    if (pair.tasks.empty()) return false;
    for (const auto& id : pair.tasks) {
        const Task* t = ledger.find_task(id);
        if (!t || t->status != TaskStatus::Completed) return false;
    }
    return true;
}

TaskPair* find_next_blocked_pair(Ledger& ledger, std::optional<long long> after) {
    TaskPair* best = nullptr;
    for (auto& p : ledger.task_pairs) {
        if (p.status != PairStatus::Blocked) continue;
        if (after && p.sequence_index <= *after) continue;
        if (!best || p.sequence_index < best->sequence_index) best = &p;
    }
    return best;
}

bool mark_pair_ready(TaskPair& pair, const std::string& actor, const std::string& details) {
    if (!can_transition(pair.status, PairStatus::Ready)) return false;
    pair.status = PairStatus::Ready;
    pair.pair_lock = false;
    append_history(pair, kEventStatusChanged, actor, details);
    return true;
}

AdvanceResult advance_if_pair_complete(TaskPair& pair, Ledger& ledger, const std::string& actor) {
    AdvanceResult result;
    // Only a READY pair can complete; re-running on a finished pair must not
    // open a second successor.
    if (!can_transition(pair.status, PairStatus::Completed)) return result;
    if (!pair_tasks_completed(pair, ledger)) return result;

    pair.status = PairStatus::Completed;
    pair.pair_lock = true;
    append_history(pair, kEventStatusChanged, actor, "Pair status changed to COMPLETED by " + actor);
    result.pair_completed = true;

    if (TaskPair* next = find_next_blocked_pair(ledger, pair.sequence_index)) {
        if (mark_pair_ready(*next, actor, "Pair status changed to READY by " + actor + " (advancement)")) {
            result.next_ready = next;
        }
    }
    return result;
}
