#pragma once

#include "threnody/cluster_selector.hpp"
#include "threnody/config.hpp"
#include "threnody/pool_manager.hpp"
#include "threnody/store_gateway.hpp"
#include "threnody/types.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace threnody {

enum class CoordinatorState {
    Uninitialized,
    Initializing,
    Running,
    Paused,
    Stopped
};

const char* coordinator_state_str(CoordinatorState state);

struct CoordinatorStats {
    CoordinatorState state = CoordinatorState::Uninitialized;
    bool degraded = false;
    size_t working_set_size = 0;
    size_t target_size = 0;
    size_t priority_members = 0;
    uint64_t clusters_emitted = 0;
    uint64_t cycles_skipped = 0;
    std::optional<MessageId> current_focus;
    std::optional<MessageId> current_next;
    PoolStats pool;
};

/**
 * Owns the working set and drives the traversal.
 *
 * Every clusterDuration the cycle timer evicts the shown related messages,
 * refills the set from the pool and emits the next cluster. A second timer
 * polls the store for new rows. Both timers run on the supplied io_context;
 * cycle(), poll() and submit() are serialised by one mutex and may also be
 * called directly.
 *
 * Callbacks run on the calling thread after the state lock is released.
 * Exceptions escaping a callback are logged and dropped.
 */
class TraversalCoordinator {
public:
    using ClusterCallback = std::function<void(const MessageCluster&)>;
    using WorkingSetCallback = std::function<void(const WorkingSetChange&)>;

    TraversalCoordinator(boost::asio::io_context& io,
                         std::shared_ptr<StoreGateway> gateway,
                         const EngineConfig& engine,
                         const IntakeConfig& intake = IntakeConfig{},
                         std::shared_ptr<ClusterSelector> selector = nullptr);
    ~TraversalCoordinator();

    TraversalCoordinator(const TraversalCoordinator&) = delete;
    TraversalCoordinator& operator=(const TraversalCoordinator&) = delete;

    void on_cluster_changed(ClusterCallback callback);
    void on_working_set_changed(WorkingSetCallback callback);

    // Fills the working set, emits the first cluster and arms both timers.
    // Any store failure leaves the engine running in degraded mode.
    void initialize();

    // One evict/replenish/select/emit step. Returns true when a cluster was emitted.
    bool cycle();

    // Folds new rows into the priority queue; returns how many were found
    size_t poll();

    // Forwards an already stored message to the priority path
    bool submit(const Message& message);

    // Validates, stores and queues new content. Throws ValidationError, or
    // the store's error when the insert fails.
    Message submit(const std::string& content);

    void pause();
    void resume();

    // Idempotent; cancels both timers and empties the pool
    void stop();

    // Forget the previous cluster and the shown counter; the working set is kept
    void reset_traversal();

    std::optional<MessageCluster> get_current_cluster() const;
    CoordinatorStats get_stats() const;
    WorkingSet working_set() const;
    size_t priority_member_count() const;
    CoordinatorState state() const { return state_.load(); }

private:
    struct PendingEvents {
        std::optional<WorkingSetChange> change;
        std::optional<MessageCluster> cluster;
    };

    bool try_initialize_pool();
    std::vector<Message> replenish(WorkingSet& working_set, PriorityIds& priority_ids);
    std::optional<MessageCluster> select_cluster(const MessageCluster* previous);
    void commit_cluster(MessageCluster cluster, PendingEvents& events);
    void check_health();
    void update_gauges();
    void emit(PendingEvents& events);

    void schedule_cycle();
    void schedule_poll();

    std::shared_ptr<StoreGateway> gateway_;
    EngineConfig engine_;
    IntakeConfig intake_;
    PoolManager pool_;
    std::shared_ptr<ClusterSelector> selector_;

    mutable std::mutex mutex_;
    WorkingSet working_set_;
    PriorityIds priority_members_;
    std::optional<MessageCluster> current_;
    uint64_t shown_ = 0;
    uint64_t cycles_skipped_ = 0;
    bool degraded_ = false;
    bool health_warned_ = false;

    std::atomic<CoordinatorState> state_{CoordinatorState::Uninitialized};
    std::atomic<bool> cycle_in_flight_{false};
    std::atomic<bool> poll_in_flight_{false};

    std::mutex callback_mutex_;
    ClusterCallback cluster_callback_;
    WorkingSetCallback working_set_callback_;

    std::mutex timer_mutex_;
    boost::asio::steady_timer cycle_timer_;
    boost::asio::steady_timer poll_timer_;
};

} // namespace threnody
