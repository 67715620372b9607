#include "../include/work.hpp"
#include <stdexcept>
#include <thread>

SimulatedWork::SimulatedWork(SimulatedWorkConfig cfg, Logger log)
    : cfg_(cfg), log_(std::move(log)) {
    if (cfg_.min_duration.count() < 0 || cfg_.max_duration < cfg_.min_duration) {
        throw std::invalid_argument("work duration range is invalid");
    }
    if (cfg_.failure_rate < 0.0 || cfg_.failure_rate > 1.0) {
        throw std::invalid_argument("failure rate must be within [0, 1]");
    }
    if (cfg_.seed) {
        rng_.seed(*cfg_.seed);
    } else {
        std::random_device rd;
        rng_.seed(((unsigned long long)rd() << 32) ^ rd());
    }
}

TaskStatus SimulatedWork::operator()(const Task& task) {
    log_.info("Starting work on task '" + task.id + "': '" + task.description + "'");
    std::uniform_int_distribution<long long> duration(cfg_.min_duration.count(), cfg_.max_duration.count());
    std::this_thread::sleep_for(std::chrono::milliseconds(duration(rng_)));

    std::bernoulli_distribution fails(cfg_.failure_rate);
    if (fails(rng_)) {
        log_.error("Failed to complete task '" + task.id + "'.");
        return TaskStatus::Failed;
    }
    log_.info("Successfully completed task '" + task.id + "'.");
    return TaskStatus::Completed;
}
