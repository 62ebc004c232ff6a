#pragma once

#include "threnody/config.hpp"
#include "threnody/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace threnody {

struct SimulationOptions {
    EngineConfig engine;
    size_t messages = 1000;
    size_t cycles = 50;
    uint32_t seed = 42;
    // Submit one new message every N cycles (0 disables)
    size_t submit_every = 5;
    // Extra submissions pushed in one go before this cycle (0 disables)
    size_t burst_at_cycle = 0;
    size_t burst_size = 0;
};

struct SubmissionTrace {
    MessageId id = 0;
    size_t submitted_at_cycle = 0;
    // Cycle whose cluster first featured it as focus or next; -1 if never
    int64_t featured_at_cycle = -1;
    bool entered_working_set = false;
    // Listed in a WorkingSetChange's priority ids when it entered
    bool reported_priority = false;
};

struct SimulationReport {
    size_t cycles_run = 0;
    size_t clusters_emitted = 0;
    size_t max_working_set = 0;
    size_t min_working_set = 0;
    size_t max_queue_depth = 0;
    uint64_t dropped_total = 0;
    std::vector<SubmissionTrace> submissions;
    // One line per broken invariant, prefixed with the cycle number
    std::vector<std::string> violations;

    bool ok() const { return violations.empty(); }
};

// Runs the coordinator against a seeded in-memory store without real timers,
// checking the working set and continuity invariants after every cycle.
SimulationReport run_simulation(const SimulationOptions& options);

} // namespace threnody
