#pragma once
#include "../../../shared/cpp/ledger_sdk/include/ledger.hpp"
#include "../../../shared/cpp/ledger_sdk/include/log.hpp"
#include <chrono>
#include <optional>
#include <random>

struct SimulatedWorkConfig {
    std::chrono::milliseconds min_duration{1000};
    std::chrono::milliseconds max_duration{3000};
    double failure_rate{0.1};
    std::optional<unsigned long long> seed; // random_device when empty
};

// Stand-in for real agent work: sleeps a random duration and succeeds with
// probability 1 - failure_rate.
class SimulatedWork {
public:
    SimulatedWork(SimulatedWorkConfig cfg, Logger log);
    TaskStatus operator()(const Task& task);

private:
    SimulatedWorkConfig cfg_;
    std::mt19937_64 rng_;
    Logger log_;
};
