#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

enum class TaskStatus { Pending, InProgress, Completed, Failed };
enum class PairStatus { Blocked, Ready, Completed };

const char* to_string(TaskStatus s);
const char* to_string(PairStatus s);
std::optional<TaskStatus> task_status_from_string(const std::string& s);
std::optional<PairStatus> pair_status_from_string(const std::string& s);

// History event kinds written to the ledger.
inline constexpr const char* kEventCreated = "CREATED";
inline constexpr const char* kEventUpdated = "UPDATED";
inline constexpr const char* kEventAssigned = "ASSIGNED";
inline constexpr const char* kEventStatusChanged = "STATUS_CHANGED";

struct HistoryEvent {
    std::string timestamp;
    std::string event;    // CREATED | UPDATED | ASSIGNED | STATUS_CHANGED
    std::optional<std::string> agent_id; // acting agent, null for system events
    std::string details;
};

struct Task {
    std::string id;
    std::optional<std::string> pair_id;
    std::optional<std::string> agent_preference; // empty = any agent
    std::string description;
    TaskStatus status{TaskStatus::Pending};
    std::optional<std::string> assigned_to;
    std::string created_at;
    std::string updated_at;
    std::vector<HistoryEvent> history;
};

struct TaskPair {
    std::string pair_id;
    std::vector<std::string> tasks; // two task ids, in claim order
    PairStatus status{PairStatus::Blocked};
    bool pair_lock{true};
    long long sequence_index{0};
    std::vector<HistoryEvent> history;
    std::string created_at;
    std::string updated_at;
};

struct Ledger {
    std::vector<Task> tasks;
    std::vector<TaskPair> task_pairs;

    Task* find_task(const std::string& id);
    const Task* find_task(const std::string& id) const;
    TaskPair* find_pair(const std::string& pair_id);
    const TaskPair* find_pair(const std::string& pair_id) const;
};

// Appends an event stamped with the current time and moves updated_at along.
void append_history(std::vector<HistoryEvent>& history, std::string& updated_at,
                    const std::string& event, const std::string& agent_id,
                    const std::string& details);
inline void append_history(Task& t, const std::string& event, const std::string& agent_id,
                           const std::string& details) {
    append_history(t.history, t.updated_at, event, agent_id, details);
}
inline void append_history(TaskPair& p, const std::string& event, const std::string& agent_id,
                           const std::string& details) {
    append_history(p.history, p.updated_at, event, agent_id, details);
}

void to_json(nlohmann::json& j, const TaskStatus& s);
void from_json(const nlohmann::json& j, TaskStatus& s);
void to_json(nlohmann::json& j, const PairStatus& s);
void from_json(const nlohmann::json& j, PairStatus& s);
void to_json(nlohmann::json& j, const HistoryEvent& e);
void from_json(const nlohmann::json& j, HistoryEvent& e);
void to_json(nlohmann::json& j, const Task& t);
void from_json(const nlohmann::json& j, Task& t);
void to_json(nlohmann::json& j, const TaskPair& p);
void from_json(const nlohmann::json& j, TaskPair& p);
void to_json(nlohmann::json& j, const Ledger& l);
void from_json(const nlohmann::json& j, Ledger& l);
