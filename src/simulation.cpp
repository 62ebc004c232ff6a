#include "threnody/simulation.hpp"
#include "threnody/cluster_selector.hpp"
#include "threnody/logging.hpp"
#include "threnody/store/memory_store.hpp"
#include "threnody/store_gateway.hpp"
#include "threnody/traversal_coordinator.hpp"

#include <boost/asio/io_context.hpp>

#include <algorithm>
#include <memory>
#include <unordered_set>

namespace threnody {

namespace {

void check_cycle(size_t cycle, const MessageCluster* previous, const MessageCluster& current,
                 const WorkingSet& working_set, int64_t store_count, const PoolStats& pool,
                 const EngineConfig& engine, const ClusterSelector& selector,
                 std::vector<std::string>& violations) {
    auto fail = [&](const std::string& what) {
        violations.push_back("cycle " + std::to_string(cycle) + ": " + what);
    };

    size_t target = engine.working_set_size;
    if (working_set.size() > target) {
        fail("working set holds " + std::to_string(working_set.size()) + " > " + std::to_string(target));
    }
    if (store_count >= static_cast<int64_t>(target) && working_set.size() * 10 < target * 9) {
        fail("working set under-filled at " + std::to_string(working_set.size()));
    }
    if (pool.queue_depth > engine.priority_queue_max_size) {
        fail("queue depth " + std::to_string(pool.queue_depth) + " exceeds bound");
    }

    if (auto violation = selector.validate(current, working_set.size())) {
        fail(*violation);
    }
    if (current.is_placeholder()) return;

    if (!working_set.count(current.focus->id)) {
        fail("focus " + std::to_string(current.focus->id) + " not in working set");
    }
    for (const auto& r : current.related) {
        if (!working_set.count(r.message.id)) {
            fail("related " + std::to_string(r.message.id) + " not in working set");
        }
    }

    if (!previous || previous->is_placeholder()) return;
    if (previous->next && current.focus->id != previous->next->id) {
        fail("focus " + std::to_string(current.focus->id) + " does not follow next " +
             std::to_string(previous->next->id));
    }
    bool can_hold_previous = working_set.size() >= 2 && selector.related_capacity() > 0 &&
                             previous->focus->id != current.focus->id;
    if (can_hold_previous) {
        bool kept = std::any_of(current.related.begin(), current.related.end(), [&](const RelatedMessage& r) {
            return r.message.id == previous->focus->id;
        });
        if (!kept) {
            fail("previous focus " + std::to_string(previous->focus->id) + " missing from related");
        }
    }
}

} // namespace

SimulationReport run_simulation(const SimulationOptions& options) {
    auto store = std::make_shared<MemoryMessageStore>();
    seed_store(*store, options.messages, options.seed);

    RetryConfig retry;
    retry.max_attempts = 1;
    auto gateway = std::make_shared<StoreGateway>(store, retry, [](std::chrono::milliseconds) {});

    boost::asio::io_context io;
    TraversalCoordinator coordinator(io, gateway, options.engine);
    ClusterSelector selector(options.engine);

    std::vector<MessageCluster> clusters;
    std::unordered_set<MessageId> entered;
    std::unordered_set<MessageId> reported_priority;
    coordinator.on_cluster_changed([&](const MessageCluster& cluster) { clusters.push_back(cluster); });
    coordinator.on_working_set_changed([&](const WorkingSetChange& change) {
        for (const auto& msg : change.added) entered.insert(msg.id);
        reported_priority.insert(change.priority_added.begin(), change.priority_added.end());
    });

    coordinator.initialize();

    SimulationReport report;
    report.min_working_set = coordinator.working_set().size();
    report.max_working_set = report.min_working_set;

    auto submit_one = [&](size_t cycle) {
        Message msg = coordinator.submit("Simulated submission " + std::to_string(report.submissions.size() + 1));
        SubmissionTrace trace;
        trace.id = msg.id;
        trace.submitted_at_cycle = cycle;
        report.submissions.push_back(trace);
    };

    for (size_t cycle = 1; cycle <= options.cycles; ++cycle) {
        if (options.submit_every > 0 && cycle % options.submit_every == 0) {
            submit_one(cycle);
        }
        if (options.burst_at_cycle == cycle) {
            for (size_t i = 0; i < options.burst_size; ++i) submit_one(cycle);
        }

        size_t before = clusters.size();
        coordinator.cycle();
        ++report.cycles_run;

        WorkingSet working_set = coordinator.working_set();
        CoordinatorStats stats = coordinator.get_stats();
        report.min_working_set = std::min(report.min_working_set, working_set.size());
        report.max_working_set = std::max(report.max_working_set, working_set.size());
        report.max_queue_depth = std::max(report.max_queue_depth, stats.pool.queue_depth);

        if (clusters.size() != before + 1) {
            report.violations.push_back("cycle " + std::to_string(cycle) + ": no cluster emitted");
            continue;
        }
        const MessageCluster* previous = clusters.size() >= 2 ? &clusters[clusters.size() - 2] : nullptr;
        check_cycle(cycle, previous, clusters.back(), working_set, store->count(), stats.pool,
                    options.engine, selector, report.violations);
    }

    for (auto& trace : report.submissions) {
        trace.entered_working_set = entered.count(trace.id) > 0;
        trace.reported_priority = reported_priority.count(trace.id) > 0;
        for (size_t i = 0; i < clusters.size(); ++i) {
            const MessageCluster& c = clusters[i];
            if (c.focus_id() == trace.id || c.next_id() == trace.id) {
                trace.featured_at_cycle = static_cast<int64_t>(i);
                break;
            }
        }
    }

    report.clusters_emitted = clusters.size();
    report.dropped_total = coordinator.get_stats().pool.dropped_total;
    coordinator.stop();

    LOG_INFO("[SIMULATION] " + std::to_string(report.cycles_run) + " cycles, " +
             std::to_string(report.submissions.size()) + " submissions, " +
             std::to_string(report.violations.size()) + " violations");
    return report;
}

} // namespace threnody
