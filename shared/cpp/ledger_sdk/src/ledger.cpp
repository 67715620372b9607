#include "../include/ledger.hpp"
#include "../include/util.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace {
std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

json nullable(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

std::vector<HistoryEvent> history_from(const json& j) {
    auto it = j.find("history");
    if (it == j.end() || it->is_null()) return {};
    return it->get<std::vector<HistoryEvent>>();
}
}

const char* to_string(TaskStatus s) {
    switch (s) {
        case TaskStatus::Pending: return "PENDING";
        case TaskStatus::InProgress: return "IN_PROGRESS";
        case TaskStatus::Completed: return "COMPLETED";
        case TaskStatus::Failed: return "FAILED";
    }
    return "PENDING";
}

const char* to_string(PairStatus s) {
    switch (s) {
        case PairStatus::Blocked: return "BLOCKED";
        case PairStatus::Ready: return "READY";
        case PairStatus::Completed: return "COMPLETED";
    }
    return "BLOCKED";
}

std::optional<TaskStatus> task_status_from_string(const std::string& s) {
    if (s == "PENDING") return TaskStatus::Pending;
    if (s == "IN_PROGRESS") return TaskStatus::InProgress;
    if (s == "COMPLETED") return TaskStatus::Completed;
    if (s == "FAILED") return TaskStatus::Failed;
    return std::nullopt;
}

std::optional<PairStatus> pair_status_from_string(const std::string& s) {
    if (s == "BLOCKED") return PairStatus::Blocked;
    if (s == "READY") return PairStatus::Ready;
    if (s == "COMPLETED") return PairStatus::Completed;
    return std::nullopt;
}

Task* Ledger::find_task(const std::string& id) {
    for (auto& t : tasks) if (t.id == id) return &t;
    return nullptr;
}

const Task* Ledger::find_task(const std::string& id) const {
    for (const auto& t : tasks) if (t.id == id) return &t;
    return nullptr;
}

TaskPair* Ledger::find_pair(const std::string& pair_id) {
    for (auto& p : task_pairs) if (p.pair_id == pair_id) return &p;
    return nullptr;
}

const TaskPair* Ledger::find_pair(const std::string& pair_id) const {
    for (const auto& p : task_pairs) if (p.pair_id == pair_id) return &p;
    return nullptr;
}

void append_history(std::vector<HistoryEvent>& history, std::string& updated_at,
                    const std::string& event, const std::string& agent_id,
                    const std::string& details) {
    HistoryEvent e{now_iso8601(), event, agent_id, details};
    updated_at = e.timestamp;
    history.push_back(std::move(e));
}

void to_json(json& j, const TaskStatus& s) { j = to_string(s); }

void from_json(const json& j, TaskStatus& s) {
    auto v = task_status_from_string(j.get<std::string>());
    if (!v) throw std::runtime_error("unknown task status: " + j.dump());
    s = *v;
}

void to_json(json& j, const PairStatus& s) { j = to_string(s); }

void from_json(const json& j, PairStatus& s) {
    auto v = pair_status_from_string(j.get<std::string>());
    if (!v) throw std::runtime_error("unknown pair status: " + j.dump());
    s = *v;
}

void to_json(json& j, const HistoryEvent& e) {
    j = json{
        {"timestamp", e.timestamp},
        {"event", e.event},
        {"agent_id", nullable(e.agent_id)},
        {"details", e.details}
    };
}

void from_json(const json& j, HistoryEvent& e) {
    e.timestamp = j.value("timestamp", std::string());
    e.event = j.value("event", std::string());
    e.agent_id = optional_string(j, "agent_id");
    e.details = j.value("details", std::string());
}

void to_json(json& j, const Task& t) {
    j = json{
        {"id", t.id},
        {"pair_id", nullable(t.pair_id)},
        {"agent_preference", nullable(t.agent_preference)},
        {"description", t.description},
        {"status", t.status},
        {"assigned_to", nullable(t.assigned_to)},
        {"created_at", t.created_at},
        {"updated_at", t.updated_at},
        {"history", t.history}
    };
}

void from_json(const json& j, Task& t) {
    t.id = j.at("id").get<std::string>();
    t.pair_id = optional_string(j, "pair_id");
    t.agent_preference = optional_string(j, "agent_preference");
    t.description = j.value("description", std::string());
    t.status = j.at("status").get<TaskStatus>();
    t.assigned_to = optional_string(j, "assigned_to");
    t.created_at = j.value("created_at", std::string());
    t.updated_at = j.value("updated_at", std::string());
    t.history = history_from(j);
}

void to_json(json& j, const TaskPair& p) {
    j = json{
        {"pair_id", p.pair_id},
        {"tasks", p.tasks},
        {"status", p.status},
        {"pair_lock", p.pair_lock},
        {"sequence_index", p.sequence_index},
        {"history", p.history},
        {"created_at", p.created_at},
        {"updated_at", p.updated_at}
    };
}

void from_json(const json& j, TaskPair& p) {
    p.pair_id = j.at("pair_id").get<std::string>();
    p.tasks = j.at("tasks").get<std::vector<std::string>>();
    p.status = j.at("status").get<PairStatus>();
    p.pair_lock = j.value("pair_lock", false);
    const auto& seq = j.at("sequence_index");
    if (!seq.is_number_integer()) {
        throw std::runtime_error("pair " + p.pair_id + " has non-integer sequence_index");
    }
    p.sequence_index = seq.get<long long>();
    p.history = history_from(j);
    p.created_at = j.value("created_at", std::string());
    p.updated_at = j.value("updated_at", std::string());
}

void to_json(json& j, const Ledger& l) {
    j = json{
        {"tasks", l.tasks},
        {"task_pairs", l.task_pairs}
    };
}

void from_json(const json& j, Ledger& l) {
    if (!j.is_object()) throw std::runtime_error("ledger document is not a JSON object");
    l.tasks.clear();
    l.task_pairs.clear();
    if (j.contains("tasks")) l.tasks = j.at("tasks").get<std::vector<Task>>();
    if (j.contains("task_pairs")) l.task_pairs = j.at("task_pairs").get<std::vector<TaskPair>>();
}
