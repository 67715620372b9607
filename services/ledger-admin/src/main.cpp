#include "../include/admin.hpp"
#include "../../../shared/cpp/ledger_sdk/include/util.hpp"
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <unistd.h>

static void usage() {
    std::cerr << "ledger_admin usage:\n"
              << "  ledger_admin [--task-file <path>] [--lock-file <path>] [--stale-timeout S] <command> [options]\n"
              << "  init [--force]\n"
              << "  add_task --desc <text> [--agent_pref <agent>] [--pair_id <id>] [--task_id <id>]\n"
              << "  add_pair --task_id1 <id> --task_id2 <id> --seq_idx N [--pair_id <id>]\n"
              << "           [--status BLOCKED|READY|COMPLETED] [--lock true|false]\n"
              << "  create_full_pair --desc1 <text> [--agent1 <agent>] --desc2 <text> [--agent2 <agent>]\n"
              << "                   --seq_idx N [--pair_id <prefix>]\n"
              << "  status [--pair_id <id> | --task_id <id>]\n"
              << "  advance_next_pair [--force]\n"
              << "  validate\n";
}

static std::optional<std::string> opt(const std::map<std::string, std::string>& m, const std::string& key) {
    auto it = m.find(key);
    if (it == m.end()) return std::nullopt;
    return it->second;
}

static void print_result(const AdminResult& r) {
    for (const auto& w : r.warnings) std::cerr << "Warning: " << w << "\n";
    if (r.ok) std::cout << r.message << "\n";
    else std::cerr << "Error: " << r.message << "\n";
}

int main(int argc, char** argv) {
    std::string task_file = getenv_or("TASK_FILE", "tasks.json");
    std::string lock_file = getenv_or("LOCK_FILE", "tasks.lock");
    std::string stale = getenv_or("LOCK_STALE_TIMEOUT", "300");
    std::string cmd;
    std::map<std::string, std::string> opts;
    std::set<std::string> flags;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--task-file" && i + 1 < argc) task_file = argv[++i];
        else if (a == "--lock-file" && i + 1 < argc) lock_file = argv[++i];
        else if (a == "--stale-timeout" && i + 1 < argc) stale = argv[++i];
        else if (a == "--force") flags.insert(a);
        else if (a.rfind("--", 0) == 0 && i + 1 < argc) opts[a] = argv[++i];
        else if (a.rfind("--", 0) != 0 && cmd.empty()) cmd = a;
        else { usage(); return 2; }
    }
    if (cmd.empty()) { usage(); return 2; }

    try {
        const std::string actor = "cli_user_" + std::to_string(::getpid());
        Logger log("ledger-admin", log_level_from_string(getenv_or("LOG_LEVEL", "WARNING"), LogLevel::Warning));
        LedgerStore store(task_file, log);
        LockManager lock(lock_file, actor, log);
        LockOptions lock_opts{std::chrono::seconds(15), std::chrono::seconds(1), std::chrono::seconds(std::stoll(stale))};
        LedgerAdmin admin(store, lock, lock_opts, log);

        if (cmd == "init") {
            AdminResult r = admin.init(flags.count("--force") > 0);
            print_result(r);
            return r.ok ? 0 : 1;
        }
        if (cmd == "add_task") {
            NewTask t;
            auto desc = opt(opts, "--desc");
            if (!desc) { usage(); return 2; }
            t.description = *desc;
            t.agent_preference = opt(opts, "--agent_pref");
            t.pair_id = opt(opts, "--pair_id");
            t.task_id = opt(opts, "--task_id");
            AdminResult r = admin.add_task(t);
            print_result(r);
            return r.ok ? 0 : 1;
        }
        if (cmd == "add_pair") {
            auto t1 = opt(opts, "--task_id1");
            auto t2 = opt(opts, "--task_id2");
            auto seq = opt(opts, "--seq_idx");
            if (!t1 || !t2 || !seq) { usage(); return 2; }
            NewPair p;
            p.task_id1 = *t1;
            p.task_id2 = *t2;
            p.sequence_index = std::stoll(*seq);
            p.pair_id = opt(opts, "--pair_id");
            if (auto s = opt(opts, "--status")) {
                auto status = pair_status_from_string(*s);
                if (!status) { std::cerr << "Error: invalid --status '" << *s << "'\n"; return 2; }
                p.status = *status;
            }
            if (auto l = opt(opts, "--lock")) p.pair_lock = (*l == "true" || *l == "True" || *l == "TRUE");
            AdminResult r = admin.add_pair(p);
            print_result(r);
            return r.ok ? 0 : 1;
        }
        if (cmd == "create_full_pair") {
            auto d1 = opt(opts, "--desc1");
            auto d2 = opt(opts, "--desc2");
            auto seq = opt(opts, "--seq_idx");
            if (!d1 || !d2 || !seq) { usage(); return 2; }
            NewFullPair fp;
            fp.description1 = *d1;
            fp.agent1 = opt(opts, "--agent1");
            fp.description2 = *d2;
            fp.agent2 = opt(opts, "--agent2");
            fp.sequence_index = std::stoll(*seq);
            fp.prefix = opt(opts, "--pair_id");
            AdminResult r = admin.create_full_pair(fp);
            print_result(r);
            return r.ok ? 0 : 1;
        }
        if (cmd == "status") {
            auto out = admin.status(opt(opts, "--pair_id"), opt(opts, "--task_id"));
            if (!out) {
                std::cerr << "Error: could not read or parse " << task_file << "\n";
                return 1;
            }
            std::cout << out->dump(2) << "\n";
            return out->contains("error") ? 1 : 0;
        }
        if (cmd == "advance_next_pair") {
            AdminResult r = admin.advance_next_pair(flags.count("--force") > 0);
            print_result(r);
            return r.ok ? 0 : 1;
        }
        if (cmd == "validate") {
            ValidationReport rep = admin.validate();
            if (!rep.fingerprint.empty()) std::cout << "Ledger SHA-1: " << rep.fingerprint << "\n";
            if (!rep.errors.empty()) {
                std::cout << "Validation Errors Found:\n";
                for (const auto& e : rep.errors) std::cout << "  - " << e << "\n";
            }
            if (!rep.warnings.empty()) {
                std::cout << "Validation Warnings Found:\n";
                for (const auto& w : rep.warnings) std::cout << "  - " << w << "\n";
            }
            if (rep.errors.empty() && rep.warnings.empty()) {
                std::cout << "Validation successful: No errors or warnings found.\n";
            } else if (rep.errors.empty()) {
                std::cout << "Validation successful: No errors found, but there are warnings.\n";
            }
            return rep.ok() ? 0 : 1;
        }
        usage();
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
