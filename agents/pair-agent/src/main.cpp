#include "../include/agent_loop.hpp"
#include "../include/work.hpp"
#include "../../../shared/cpp/ledger_sdk/include/util.hpp"
#include <iostream>
#include <chrono>
#include <optional>
#include <string>

static void usage() {
    std::cerr << "pair_agent usage:\n"
              << "  pair_agent <agent_id> [--task-file <path>] [--lock-file <path>] [--cycles N]\n"
              << "             [--interval S] [--stale-timeout S] [--max-wait S] [--retry-interval S]\n"
              << "             [--work-min-ms N] [--work-max-ms N] [--failure-rate F] [--seed N]\n";
}

// The ledger must already be initialized by ledger_admin.
static bool check_ledger(const LedgerStore& store) {
    if (!store.exists()) {
        std::cerr << "[ERROR] Task file '" << store.path().string()
                  << "' not found. Please initialize it using ledger_admin first.\n";
        return false;
    }
    auto doc = store.read_document();
    if (!doc) {
        std::cerr << "[ERROR] Task file '" << store.path().string() << "' contains invalid JSON.\n";
        return false;
    }
    if (!doc->is_object() || !doc->contains("tasks") || !doc->contains("task_pairs") ||
        !(*doc)["tasks"].is_array() || !(*doc)["task_pairs"].is_array()) {
        std::cerr << "[ERROR] Task file '" << store.path().string()
                  << "' is not correctly initialized. Expected a JSON object with 'tasks' and 'task_pairs' arrays.\n";
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    if (argc < 2 || std::string(argv[1]).rfind("--", 0) == 0) { usage(); return 2; }
    const std::string agent = argv[1];
    try {
        std::string task_file = getenv_or("TASK_FILE", "tasks.json");
        std::string lock_file = getenv_or("LOCK_FILE", "tasks.lock");
        LockOptions lock_opts;
        lock_opts.stale_timeout = std::chrono::seconds(std::stoll(getenv_or("LOCK_STALE_TIMEOUT", "300")));
        lock_opts.max_wait = std::chrono::seconds(std::stoll(getenv_or("LOCK_MAX_WAIT", "60")));
        lock_opts.retry_interval = std::chrono::seconds(std::stoll(getenv_or("LOCK_RETRY_INTERVAL", "5")));
        std::optional<std::size_t> cycles;
        long long interval_s = 10;
        SimulatedWorkConfig work_cfg;

        for (int i = 2; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--task-file" && i + 1 < argc) task_file = argv[++i];
            else if (a == "--lock-file" && i + 1 < argc) lock_file = argv[++i];
            else if (a == "--cycles" && i + 1 < argc) cycles = std::stoul(argv[++i]);
            else if (a == "--interval" && i + 1 < argc) interval_s = std::stoll(argv[++i]);
            else if (a == "--stale-timeout" && i + 1 < argc) lock_opts.stale_timeout = std::chrono::seconds(std::stoll(argv[++i]));
            else if (a == "--max-wait" && i + 1 < argc) lock_opts.max_wait = std::chrono::seconds(std::stoll(argv[++i]));
            else if (a == "--retry-interval" && i + 1 < argc) lock_opts.retry_interval = std::chrono::seconds(std::stoll(argv[++i]));
            else if (a == "--work-min-ms" && i + 1 < argc) work_cfg.min_duration = std::chrono::milliseconds(std::stoll(argv[++i]));
            else if (a == "--work-max-ms" && i + 1 < argc) work_cfg.max_duration = std::chrono::milliseconds(std::stoll(argv[++i]));
            else if (a == "--failure-rate" && i + 1 < argc) work_cfg.failure_rate = std::stod(argv[++i]);
            else if (a == "--seed" && i + 1 < argc) work_cfg.seed = std::stoull(argv[++i]);
            else { usage(); return 2; }
        }

        Logger log(agent);
        LedgerStore store(task_file, log);
        if (!check_ledger(store)) return 1;
        LockManager lock(lock_file, agent, log);

        std::cout << "[" << agent << "] Starting. task_file=" << task_file << " lock_file=" << lock_file
                  << " stale_timeout=" << lock_opts.stale_timeout.count() << "s" << std::endl;
        PairAgent runner(store, lock, lock_opts, SimulatedWork(work_cfg, log), log);
        runner.run(cycles, std::chrono::seconds(interval_s));
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
