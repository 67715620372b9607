#include "../include/admin.hpp"
#include "../../../shared/cpp/ledger_sdk/include/pair_state.hpp"
#include "../../../shared/cpp/ledger_sdk/include/util.hpp"
#include <map>
#include <set>

using json = nlohmann::json;

namespace {
AdminResult failure(std::string message) {
    AdminResult r;
    r.ok = false;
    r.message = std::move(message);
    return r;
}

std::string snippet(const json& j) {
    std::string s = j.dump();
    return s.size() > 50 ? s.substr(0, 50) : s;
}

const json& array_or_empty(const json& doc, const char* key) {
    static const json empty = json::array();
    auto it = doc.find(key);
    return (it != doc.end() && it->is_array()) ? *it : empty;
}

std::string string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    return (it != obj.end() && it->is_string()) ? it->get<std::string>() : std::string();
}
}

LedgerAdmin::LedgerAdmin(LedgerStore& store, LockManager& lock, LockOptions lock_opts, Logger log)
    : store_(store), lock_(lock), lock_opts_(lock_opts), log_(std::move(log)) {}

AdminResult LedgerAdmin::mutate(const std::function<AdminResult(Ledger&)>& fn) {
    ScopedLock guard(lock_, lock_opts_);
    if (!guard) {
        return failure("CLI failed to acquire lock on " + lock_.path().string() + " within " +
                       std::to_string(lock_opts_.max_wait.count()) + "ms.");
    }
    auto ledger = store_.read();
    if (!ledger) {
        return failure("Could not read or parse " + store_.path().string() + ". Nothing was changed.");
    }
    AdminResult r = fn(*ledger);
    if (r.ok && r.changed && !store_.write(*ledger)) {
        return failure("Error writing to " + store_.path().string() + ".");
    }
    return r;
}

AdminResult LedgerAdmin::init(bool force) {
    ScopedLock guard(lock_, lock_opts_);
    if (!guard) {
        return failure("CLI failed to acquire lock on " + lock_.path().string() + ".");
    }
    // Checked under the lock so a ledger created while we waited is not clobbered.
    if (store_.exists() && !force) {
        return failure("Task file '" + store_.path().string() + "' already exists. Use --force to overwrite.");
    }
    if (!store_.write(Ledger{})) {
        return failure("Error writing to " + store_.path().string() + ".");
    }
    AdminResult r;
    r.changed = true;
    r.message = "Task file '" + store_.path().string() + "' initialized successfully.";
    return r;
}

AdminResult LedgerAdmin::add_task(const NewTask& spec) {
    return mutate([&](Ledger& ledger) {
        std::string id = spec.task_id && !spec.task_id->empty() ? *spec.task_id : gen_id();
        if (ledger.find_task(id)) return failure("Task ID '" + id + "' already exists.");

        Task t;
        t.id = id;
        t.pair_id = spec.pair_id;
        t.agent_preference = spec.agent_preference;
        t.description = spec.description;
        t.status = TaskStatus::Pending;
        t.created_at = now_iso8601();
        t.updated_at = t.created_at;
        append_history(t, kEventCreated, actor(), "Task created via CLI by " + actor());

        AdminResult r;
        if (spec.pair_id && !ledger.find_pair(*spec.pair_id)) {
            r.warnings.push_back("Pair '" + *spec.pair_id + "' does not exist yet.");
        }
        ledger.tasks.push_back(std::move(t));
        r.changed = true;
        r.id = id;
        r.message = "Task '" + id + "' added successfully: " + spec.description;
        return r;
    });
}

AdminResult LedgerAdmin::add_pair(const NewPair& spec) {
    return mutate([&](Ledger& ledger) {
        if (!ledger.find_task(spec.task_id1)) {
            return failure("task_id1 '" + spec.task_id1 + "' not found in existing tasks.");
        }
        if (!ledger.find_task(spec.task_id2)) {
            return failure("task_id2 '" + spec.task_id2 + "' not found in existing tasks.");
        }
        if (spec.task_id1 == spec.task_id2) {
            return failure("task_id1 and task_id2 cannot be the same.");
        }
        std::string pair_id = spec.pair_id && !spec.pair_id->empty() ? *spec.pair_id
                                                                     : "pair_" + gen_id().substr(0, 8);
        if (ledger.find_pair(pair_id)) return failure("Pair ID '" + pair_id + "' already exists.");

        AdminResult r;
        for (const auto& p : ledger.task_pairs) {
            if (p.sequence_index == spec.sequence_index) {
                r.warnings.push_back("sequence_index " + std::to_string(spec.sequence_index) +
                                     " is already in use by pair '" + p.pair_id +
                                     "'. This might lead to ordering issues if not intended.");
                break;
            }
        }

        TaskPair pair;
        pair.pair_id = pair_id;
        pair.tasks = {spec.task_id1, spec.task_id2};
        pair.status = spec.status;
        pair.pair_lock = spec.pair_lock.value_or(spec.status == PairStatus::Blocked);
        pair.sequence_index = spec.sequence_index;
        pair.created_at = now_iso8601();
        pair.updated_at = pair.created_at;
        append_history(pair, kEventCreated, actor(), "Pair created via CLI by " + actor());

        for (const auto& tid : pair.tasks) {
            Task* t = ledger.find_task(tid);
            if (t->pair_id && *t->pair_id != pair_id) {
                r.warnings.push_back("Task " + t->id + " was already part of pair " + *t->pair_id +
                                     ". Overwriting with " + pair_id + ".");
            }
            t->pair_id = pair_id;
            append_history(*t, kEventUpdated, actor(), "Associated with pair_id " + pair_id + " via CLI");
        }
        ledger.task_pairs.push_back(std::move(pair));

        r.changed = true;
        r.id = pair_id;
        r.message = "Task pair '" + pair_id + "' added successfully with tasks '" + spec.task_id1 + "', '" +
                    spec.task_id2 + "' at sequence " + std::to_string(spec.sequence_index) + ".";
        return r;
    });
}

AdminResult LedgerAdmin::create_full_pair(const NewFullPair& spec) {
    return mutate([&](Ledger& ledger) {
        std::string prefix = spec.prefix && !spec.prefix->empty() ? *spec.prefix : "fp_" + gen_id().substr(0, 4);
        const std::string id1 = prefix + "_t1";
        const std::string id2 = prefix + "_t2";
        const std::string pair_id = prefix + "_p";

        std::set<std::string> existing;
        for (const auto& t : ledger.tasks) existing.insert(t.id);
        for (const auto& p : ledger.task_pairs) existing.insert(p.pair_id);
        if (existing.count(id1) || existing.count(id2) || existing.count(pair_id)) {
            return failure("Generated ID collision for prefix '" + prefix +
                           "'. Try a different prefix or ensure IDs are unique manually.");
        }

        AdminResult r;
        for (const auto& p : ledger.task_pairs) {
            if (p.sequence_index == spec.sequence_index) {
                r.warnings.push_back("sequence_index " + std::to_string(spec.sequence_index) +
                                     " is already in use. This might lead to ordering issues if not intended.");
                break;
            }
        }

        const std::string ts = now_iso8601();
        auto make_task = [&](const std::string& id, const std::string& desc, const std::optional<std::string>& agent) {
            Task t;
            t.id = id;
            t.pair_id = pair_id;
            t.agent_preference = agent;
            t.description = desc;
            t.created_at = ts;
            t.updated_at = ts;
            append_history(t, kEventCreated, actor(), "Task created as part of full pair by " + actor());
            return t;
        };
        ledger.tasks.push_back(make_task(id1, spec.description1, spec.agent1));
        ledger.tasks.push_back(make_task(id2, spec.description2, spec.agent2));

        TaskPair pair;
        pair.pair_id = pair_id;
        pair.tasks = {id1, id2};
        pair.status = PairStatus::Blocked;
        pair.pair_lock = true;
        pair.sequence_index = spec.sequence_index;
        pair.created_at = ts;
        pair.updated_at = ts;
        append_history(pair, kEventCreated, actor(), "Pair created as part of full pair by " + actor());
        ledger.task_pairs.push_back(std::move(pair));

        r.changed = true;
        r.id = pair_id;
        r.message = "Full pair '" + pair_id + "' created with tasks '" + id1 + "' (" + spec.agent1.value_or("any") +
                    ": " + spec.description1 + ") and '" + id2 + "' (" + spec.agent2.value_or("any") + ": " +
                    spec.description2 + ") at sequence " + std::to_string(spec.sequence_index) + ".";
        return r;
    });
}

AdminResult LedgerAdmin::advance_next_pair(bool force) {
    return mutate([&](Ledger& ledger) {
        std::optional<long long> basis;
        if (!force) {
            for (const auto& p : ledger.task_pairs) {
                if (p.status == PairStatus::Completed && (!basis || p.sequence_index > *basis)) {
                    basis = p.sequence_index;
                }
            }
            if (!basis && !ledger.task_pairs.empty()) {
                return failure("No COMPLETED task pairs found to determine the 'next' one. Use --force to "
                               "advance the lowest index BLOCKED pair (e.g. the first pair).");
            }
        }

        AdminResult r;
        TaskPair* next = find_next_blocked_pair(ledger, basis);
        if (!next) {
            if (ledger.task_pairs.empty()) {
                r.message = "No task pairs exist in the file.";
            } else {
                r.message = "No suitable BLOCKED pair found to advance";
                r.message += basis ? " (after sequence " + std::to_string(*basis) + ")." : std::string(".");
            }
            return r;
        }
        mark_pair_ready(*next, actor(), "Pair advanced to READY via CLI by " + actor());
        r.changed = true;
        r.id = next->pair_id;
        r.message = "Task pair '" + next->pair_id + "' (Seq: " + std::to_string(next->sequence_index) +
                    ") advanced to READY and unlocked.";
        return r;
    });
}

std::optional<json> LedgerAdmin::status(const std::optional<std::string>& pair_id,
                                        const std::optional<std::string>& task_id) const {
    auto doc = store_.read_document();
    if (!doc) return std::nullopt;
    if (!doc->is_object()) return json{{"error", "Ledger is not a JSON object."}};
    const json& tasks = array_or_empty(*doc, "tasks");
    const json& pairs = array_or_empty(*doc, "task_pairs");

    auto find_task = [&](const std::string& id) -> const json* {
        for (const auto& t : tasks) {
            if (t.is_object() && string_field(t, "id") == id) return &t;
        }
        return nullptr;
    };

    if (pair_id) {
        for (const auto& p : pairs) {
            if (!p.is_object() || string_field(p, "pair_id") != *pair_id) continue;
            json associated = json::array();
            for (const auto& ref : array_or_empty(p, "tasks")) {
                std::string id = ref.is_string() ? ref.get<std::string>() : ref.dump();
                if (const json* t = find_task(id)) associated.push_back(*t);
                else associated.push_back(json{{"id", id}, {"error", "Not Found"}});
            }
            return json{{"pair", p}, {"associated_tasks", associated}};
        }
        return json{{"error", "Pair ID '" + *pair_id + "' not found."}};
    }
    if (task_id) {
        if (const json* t = find_task(*task_id)) return json{{"task", *t}};
        return json{{"error", "Task ID '" + *task_id + "' not found."}};
    }
    return doc;
}

ValidationReport LedgerAdmin::validate() const {
    ValidationReport report;
    report.fingerprint = store_.fingerprint();
    auto doc = store_.read_document();
    if (!doc) {
        report.errors.push_back("Ledger file " + store_.path().string() + " could not be read or parsed.");
        return report;
    }
    if (!doc->is_object()) {
        report.errors.push_back("Ledger is not a JSON object.");
        return report;
    }
    for (const char* key : {"tasks", "task_pairs"}) {
        auto it = doc->find(key);
        if (it == doc->end()) report.warnings.push_back(std::string("Missing '") + key + "' list.");
        else if (!it->is_array()) report.errors.push_back(std::string("'") + key + "' is not a list.");
    }
    const json& tasks = array_or_empty(*doc, "tasks");
    const json& pairs = array_or_empty(*doc, "task_pairs");

    std::set<std::string> known_pair_ids;
    for (const auto& p : pairs) {
        if (p.is_object()) {
            std::string pid = string_field(p, "pair_id");
            if (!pid.empty()) known_pair_ids.insert(pid);
        }
    }

    std::set<std::string> task_ids;
    for (const auto& task : tasks) {
        if (!task.is_object()) {
            report.errors.push_back("Invalid task entry found (not an object): " + snippet(task));
            continue;
        }
        std::string tid = string_field(task, "id");
        if (tid.empty()) {
            report.errors.push_back("Task found with missing ID: " + snippet(task));
        } else if (!task_ids.insert(tid).second) {
            report.errors.push_back("Duplicate task ID: " + tid);
        }

        std::string pid = string_field(task, "pair_id");
        if (!pid.empty() && !known_pair_ids.count(pid)) {
            report.errors.push_back("Task '" + tid + "' has orphaned pair_id '" + pid + "' (pair does not exist).");
        }

        auto status = task_status_from_string(string_field(task, "status"));
        if (!status) {
            report.errors.push_back("Task '" + tid + "' has invalid status " +
                                    (task.contains("status") ? task["status"].dump() : std::string("(missing)")) + ".");
            continue;
        }
        std::string assignee = string_field(task, "assigned_to");
        if (*status == TaskStatus::InProgress && assignee.empty()) {
            report.errors.push_back("Task '" + tid + "' is IN_PROGRESS but has no assigned_to.");
        }
        if (*status == TaskStatus::Pending && !assignee.empty()) {
            report.errors.push_back("Task '" + tid + "' is PENDING but assigned to " + assignee + ".");
        }
    }

    std::set<std::string> pair_ids;
    std::map<long long, std::vector<std::string>> seq_indices;
    std::vector<std::string> ready_unlocked;
    for (const auto& pair : pairs) {
        if (!pair.is_object()) {
            report.errors.push_back("Invalid task_pair entry found (not an object): " + snippet(pair));
            continue;
        }
        std::string pid = string_field(pair, "pair_id");
        if (pid.empty()) {
            report.errors.push_back("Task pair found with missing pair_id: " + snippet(pair));
        } else if (!pair_ids.insert(pid).second) {
            report.errors.push_back("Duplicate pair ID: " + pid);
        }

        auto seq = pair.find("sequence_index");
        if (seq == pair.end() || seq->is_null()) {
            report.errors.push_back("Pair '" + pid + "' has missing sequence_index.");
        } else if (!seq->is_number_integer()) {
            report.errors.push_back("Pair '" + pid + "' sequence_index is not an integer: " + seq->dump());
        } else {
            seq_indices[seq->get<long long>()].push_back(pid);
        }

        auto refs = pair.find("tasks");
        if (refs == pair.end() || !refs->is_array() || refs->size() != 2) {
            std::string found = (refs != pair.end() && refs->is_array()) ? std::to_string(refs->size()) : "non-list";
            report.errors.push_back("Pair '" + pid + "' tasks field is not a list of two task IDs (found " + found + ").");
        }
        if (refs != pair.end() && refs->is_array()) {
            for (const auto& ref : *refs) {
                if (!ref.is_string() || !task_ids.count(ref.get<std::string>())) {
                    report.errors.push_back("Pair '" + pid + "' references non-existent task ID: " +
                                            (ref.is_string() ? ref.get<std::string>() : ref.dump()));
                }
            }
        }

        auto status = pair_status_from_string(string_field(pair, "status"));
        if (!status) {
            report.errors.push_back("Pair '" + pid + "' has invalid status " +
                                    (pair.contains("status") ? pair["status"].dump() : std::string("(missing)")) + ".");
        } else if (*status == PairStatus::Ready) {
            auto lock = pair.find("pair_lock");
            if (lock == pair.end() || !lock->is_boolean() || !lock->get<bool>()) ready_unlocked.push_back(pid);
        }
    }

    const long long* prev = nullptr;
    for (const auto& kv : seq_indices) {
        if (kv.second.size() > 1) {
            std::string ids;
            for (const auto& id : kv.second) ids += (ids.empty() ? "" : ", ") + id;
            report.warnings.push_back("Duplicate sequence_index: " + std::to_string(kv.first) + " used by pairs: " +
                                      ids + ". This may cause non-deterministic ordering.");
        }
        if (prev && kv.first - *prev > 1) {
            report.warnings.push_back("Gap in sequence_index between " + std::to_string(*prev) + " and " +
                                      std::to_string(kv.first) + ".");
        }
        prev = &kv.first;
    }
    if (ready_unlocked.size() > 1) {
        std::string ids;
        for (const auto& id : ready_unlocked) ids += (ids.empty() ? "" : ", ") + id;
        report.warnings.push_back("More than one READY and unlocked pair: " + ids + ".");
    }
    return report;
}
