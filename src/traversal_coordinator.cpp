#include "threnody/traversal_coordinator.hpp"
#include "threnody/error.hpp"
#include "threnody/logging.hpp"
#include "threnody/metrics.hpp"
#include "threnody/similarity.hpp"

#include <boost/asio/error.hpp>

#include <chrono>
#include <sstream>
#include <unordered_set>

namespace threnody {

namespace {

// Replenishment gives up after this many batches in one step
constexpr int kMaxReplenishBatches = 3;

class FlagGuard {
public:
    explicit FlagGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~FlagGuard() { flag_.store(false); }

private:
    std::atomic<bool>& flag_;
};

std::vector<MessageId> priority_subset(const std::vector<Message>& added, const PriorityIds& priority_ids) {
    std::vector<MessageId> ids;
    for (const auto& msg : added) {
        if (priority_ids.count(msg.id)) ids.push_back(msg.id);
    }
    return ids;
}

std::string describe(const MessageCluster* cluster) {
    if (!cluster) return "none";
    std::ostringstream out;
    out << "focus=" << (cluster->focus ? std::to_string(cluster->focus->id) : "-")
        << " next=" << (cluster->next ? std::to_string(cluster->next->id) : "-")
        << " related=" << cluster->related.size();
    return out.str();
}

} // namespace

const char* coordinator_state_str(CoordinatorState state) {
    switch (state) {
        case CoordinatorState::Uninitialized: return "uninitialized";
        case CoordinatorState::Initializing: return "initializing";
        case CoordinatorState::Running: return "running";
        case CoordinatorState::Paused: return "paused";
        case CoordinatorState::Stopped: return "stopped";
    }
    return "unknown";
}

TraversalCoordinator::TraversalCoordinator(boost::asio::io_context& io,
                                           std::shared_ptr<StoreGateway> gateway,
                                           const EngineConfig& engine,
                                           const IntakeConfig& intake,
                                           std::shared_ptr<ClusterSelector> selector)
    : gateway_(gateway),
      engine_(engine),
      intake_(intake),
      pool_(std::move(gateway), engine),
      selector_(selector ? std::move(selector) : std::make_shared<ClusterSelector>(engine)),
      cycle_timer_(io),
      poll_timer_(io) {}

TraversalCoordinator::~TraversalCoordinator() {
    stop();
}

void TraversalCoordinator::on_cluster_changed(ClusterCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cluster_callback_ = std::move(callback);
}

void TraversalCoordinator::on_working_set_changed(WorkingSetCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    working_set_callback_ = std::move(callback);
}

void TraversalCoordinator::initialize() {
    CoordinatorState expected = CoordinatorState::Uninitialized;
    if (!state_.compare_exchange_strong(expected, CoordinatorState::Initializing)) {
        throw InvalidArgumentError(std::string("initialize called while ") + coordinator_state_str(expected),
                                   "TraversalCoordinator");
    }

    LOG_INFO("[COORDINATOR] Initializing (working set " + std::to_string(engine_.working_set_size) +
             ", cluster size " + std::to_string(engine_.cluster_size) + ")");

    PendingEvents events;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<Message> added;
        if (try_initialize_pool()) {
            try {
                added = replenish(working_set_, priority_members_);
            } catch (const ThrenodyException& e) {
                LOG_ERROR(std::string("[COORDINATOR] Initial fill failed, running degraded: ") + e.what());
                degraded_ = true;
            }
        }
        std::vector<MessageId> priority_added = priority_subset(added, priority_members_);
        events.change = WorkingSetChange{{}, std::move(added), std::move(priority_added),
                                         ChangeReason::Initialization};

        if (working_set_.empty()) {
            LOG_WARNING("[COORDINATOR] No messages available, showing placeholder");
        } else {
            LOG_INFO("[COORDINATOR] Working set filled with " + std::to_string(working_set_.size()) +
                     " messages (" + std::to_string(priority_members_.size()) + " first-class)");
        }

        if (auto cluster = select_cluster(nullptr)) {
            commit_cluster(std::move(*cluster), events);
        }
        check_health();
        update_gauges();
    }

    expected = CoordinatorState::Initializing;
    state_.compare_exchange_strong(expected, CoordinatorState::Running);

    emit(events);
    schedule_cycle();
    schedule_poll();
}

bool TraversalCoordinator::cycle() {
    if (cycle_in_flight_.exchange(true)) {
        LOG_WARNING("[COORDINATOR] Previous cycle still running, tick dropped");
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++cycles_skipped_;
        }
        Metrics::getInstance().increment_counter("cycles_skipped");
        return false;
    }
    FlagGuard in_flight(cycle_in_flight_);
    METRICS_TIMER(cycle_duration_us);

    PendingEvents events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.load() != CoordinatorState::Running) {
            return false;
        }

        // Everything shown as related leaves; next stays to become the focus
        std::vector<MessageId> outgoing;
        if (current_) {
            std::optional<MessageId> next_id = current_->next_id();
            for (const auto& r : current_->related) {
                if (next_id && r.message.id == *next_id) continue;
                if (working_set_.count(r.message.id)) outgoing.push_back(r.message.id);
            }
        }

        WorkingSet next_set = working_set_;
        PriorityIds next_priority = priority_members_;
        for (MessageId id : outgoing) {
            next_set.erase(id);
            next_priority.erase(id);
        }

        std::vector<Message> added;
        if (pool_.initialized() || try_initialize_pool()) {
            try {
                added = replenish(next_set, next_priority);
            } catch (const ThrenodyException& e) {
                ++cycles_skipped_;
                Metrics::getInstance().increment_counter("cycles_skipped");
                LOG_WARNING(std::string("[COORDINATOR] Cycle skipped, store error: ") + e.what());
                return false;
            }
            if (degraded_) {
                LOG_INFO("[COORDINATOR] Replenishment succeeded, leaving degraded mode");
                degraded_ = false;
            }
        }

        working_set_ = std::move(next_set);
        priority_members_ = std::move(next_priority);
        LOG_DEBUG("[COORDINATOR] Cycle " + std::to_string(shown_) + ": evicted " +
                  std::to_string(outgoing.size()) + ", added " + std::to_string(added.size()) +
                  ", working set " + std::to_string(working_set_.size()));
        std::vector<MessageId> priority_added = priority_subset(added, priority_members_);
        events.change = WorkingSetChange{std::move(outgoing), std::move(added), std::move(priority_added),
                                         ChangeReason::Cycle};

        MessageCluster* previous = current_ ? &*current_ : nullptr;
        if (auto cluster = select_cluster(previous)) {
            commit_cluster(std::move(*cluster), events);
        } else {
            ++cycles_skipped_;
            Metrics::getInstance().increment_counter("cycles_skipped");
        }

        check_health();
        update_gauges();
    }

    bool emitted = events.cluster.has_value();
    emit(events);
    return emitted;
}

size_t TraversalCoordinator::poll() {
    if (poll_in_flight_.exchange(true)) {
        return 0;
    }
    FlagGuard in_flight(poll_in_flight_);

    std::lock_guard<std::mutex> lock(mutex_);
    CoordinatorState state = state_.load();
    if (state == CoordinatorState::Uninitialized || state == CoordinatorState::Stopped || !pool_.initialized()) {
        return 0;
    }

    try {
        size_t found = pool_.poll();
        update_gauges();
        return found;
    } catch (const ThrenodyException& e) {
        LOG_WARNING(std::string("[COORDINATOR] Poll skipped, store error: ") + e.what());
        return 0;
    }
}

bool TraversalCoordinator::submit(const Message& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load() == CoordinatorState::Stopped) {
        return false;
    }
    return pool_.mark_new_submission(message);
}

Message TraversalCoordinator::submit(const std::string& content) {
    std::string text = validate_content(content);
    Message message = gateway_->insert(text, intake_.auto_approve);
    if (!submit(message)) {
        LOG_DEBUG("[COORDINATOR] Submission " + std::to_string(message.id) + " not queued");
    }
    return message;
}

void TraversalCoordinator::pause() {
    CoordinatorState expected = CoordinatorState::Running;
    if (state_.compare_exchange_strong(expected, CoordinatorState::Paused)) {
        LOG_INFO("[COORDINATOR] Paused");
    }
}

void TraversalCoordinator::resume() {
    CoordinatorState expected = CoordinatorState::Paused;
    if (state_.compare_exchange_strong(expected, CoordinatorState::Running)) {
        LOG_INFO("[COORDINATOR] Resumed");
    }
}

void TraversalCoordinator::stop() {
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        if (state_.exchange(CoordinatorState::Stopped) == CoordinatorState::Stopped) {
            return;
        }
        cycle_timer_.cancel();
        poll_timer_.cancel();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pool_.reset();
        update_gauges();
    }
    LOG_INFO("[COORDINATOR] Stopped");
}

void TraversalCoordinator::reset_traversal() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_.reset();
    shown_ = 0;
    LOG_INFO("[COORDINATOR] Traversal reset");
}

std::optional<MessageCluster> TraversalCoordinator::get_current_cluster() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

CoordinatorStats TraversalCoordinator::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CoordinatorStats stats;
    stats.state = state_.load();
    stats.degraded = degraded_;
    stats.working_set_size = working_set_.size();
    stats.target_size = engine_.working_set_size;
    stats.priority_members = priority_members_.size();
    stats.clusters_emitted = shown_;
    stats.cycles_skipped = cycles_skipped_;
    if (current_) {
        stats.current_focus = current_->focus_id();
        stats.current_next = current_->next_id();
    }
    stats.pool = pool_.stats();
    return stats;
}

WorkingSet TraversalCoordinator::working_set() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return working_set_;
}

size_t TraversalCoordinator::priority_member_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return priority_members_.size();
}

bool TraversalCoordinator::try_initialize_pool() {
    try {
        pool_.initialize();
        if (degraded_) {
            LOG_INFO("[COORDINATOR] Store reachable again, leaving degraded mode");
        }
        degraded_ = false;
        return true;
    } catch (const ThrenodyException& e) {
        if (!degraded_) {
            LOG_ERROR(std::string("[COORDINATOR] Store error, running degraded: ") + e.what());
        } else {
            LOG_WARNING(std::string("[COORDINATOR] Store still failing: ") + e.what());
        }
        degraded_ = true;
        return false;
    }
}

std::vector<Message> TraversalCoordinator::replenish(WorkingSet& working_set, PriorityIds& priority_ids) {
    std::vector<Message> added;
    for (int attempt = 0; attempt < kMaxReplenishBatches; ++attempt) {
        if (working_set.size() >= engine_.working_set_size) break;
        size_t deficit = engine_.working_set_size - working_set.size();

        Batch batch;
        try {
            batch = pool_.next_batch(deficit, [&working_set](MessageId id) { return working_set.count(id) > 0; });
        } catch (const ThrenodyException& e) {
            if (added.empty()) throw;
            LOG_WARNING(std::string("[COORDINATOR] Replenishment cut short: ") + e.what());
            break;
        }
        if (batch.messages.empty()) break;

        std::unordered_set<MessageId> fresh(batch.priority_ids.begin(), batch.priority_ids.end());
        size_t accepted = 0;
        for (auto& msg : batch.messages) {
            if (!working_set.emplace(msg.id, msg).second) continue;
            if (fresh.count(msg.id)) priority_ids.insert(msg.id);
            added.push_back(std::move(msg));
            ++accepted;
        }
        if (accepted < batch.messages.size()) {
            LOG_DEBUG("[COORDINATOR] Dropped " + std::to_string(batch.messages.size() - accepted) +
                      " messages already in the working set");
        }
        if (accepted == 0) break;
    }
    return added;
}

std::optional<MessageCluster> TraversalCoordinator::select_cluster(const MessageCluster* previous) {
    try {
        return selector_->select(working_set_, priority_members_, previous);
    } catch (const InvariantViolationError& e) {
        Metrics::getInstance().increment_counter("invariant_violations");
        LOG_ERROR(std::string("[COORDINATOR] ") + e.what() + " (working set " +
                  std::to_string(working_set_.size()) + ", first-class " +
                  std::to_string(priority_members_.size()) + ", previous " + describe(previous) + ")");
        if (!previous) {
            return std::nullopt;
        }
    }

    try {
        MessageCluster cluster = selector_->select(working_set_, priority_members_, nullptr);
        LOG_WARNING("[COORDINATOR] Recovered by selecting without the previous cluster");
        return cluster;
    } catch (const InvariantViolationError& e) {
        Metrics::getInstance().increment_counter("invariant_violations");
        LOG_CRITICAL(std::string("[COORDINATOR] Selection failed twice, cluster not emitted: ") + e.what());
        return std::nullopt;
    }
}

void TraversalCoordinator::commit_cluster(MessageCluster cluster, PendingEvents& events) {
    // Featured messages lose first-class status but stay in the set
    if (cluster.focus) priority_members_.erase(cluster.focus->id);
    if (cluster.next) priority_members_.erase(cluster.next->id);

    cluster.total_shown = shown_++;
    Metrics::getInstance().increment_counter("clusters_emitted");

    ClusterStats stats = selector_->cluster_stats(cluster);
    LOG_DEBUG("[COORDINATOR] Cluster " + std::to_string(cluster.total_shown) + " " + describe(&cluster) +
              " avg similarity " + std::to_string(stats.avg_similarity) +
              " diversity " + std::to_string(stats.diversity));

    current_ = cluster;
    events.cluster = std::move(cluster);
}

void TraversalCoordinator::check_health() {
    if (!pool_.initialized()) return;

    size_t target = engine_.working_set_size;
    if (working_set_.size() * 10 >= target * 9) {
        if (health_warned_) {
            LOG_INFO("[COORDINATOR] Working set back to " + std::to_string(working_set_.size()) + "/" +
                     std::to_string(target));
        }
        health_warned_ = false;
        return;
    }
    if (health_warned_) return;

    try {
        int64_t available = gateway_->count();
        if (available >= static_cast<int64_t>(target)) {
            LOG_WARNING("[COORDINATOR] Working set at " + std::to_string(working_set_.size()) + "/" +
                        std::to_string(target) + " although the store holds " +
                        std::to_string(available) + " messages");
            health_warned_ = true;
        }
    } catch (const ThrenodyException& e) {
        LOG_DEBUG(std::string("[COORDINATOR] Health check skipped: ") + e.what());
    }
}

void TraversalCoordinator::update_gauges() {
    auto& metrics = Metrics::getInstance();
    metrics.set_gauge("working_set_size", static_cast<double>(working_set_.size()));
    metrics.set_gauge("priority_members", static_cast<double>(priority_members_.size()));
}

void TraversalCoordinator::emit(PendingEvents& events) {
    ClusterCallback on_cluster;
    WorkingSetCallback on_change;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        on_cluster = cluster_callback_;
        on_change = working_set_callback_;
    }

    if (events.change && on_change) {
        try {
            on_change(*events.change);
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("[COORDINATOR] Working set callback threw: ") + e.what());
        }
    }
    if (events.cluster && on_cluster) {
        try {
            on_cluster(*events.cluster);
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("[COORDINATOR] Cluster callback threw: ") + e.what());
        }
    }
}

void TraversalCoordinator::schedule_cycle() {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (state_.load() == CoordinatorState::Stopped) return;

    cycle_timer_.expires_after(std::chrono::milliseconds(engine_.cluster_duration_ms));
    cycle_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        if (state_.load() == CoordinatorState::Running) {
            try {
                cycle();
            } catch (const std::exception& e) {
                LOG_ERROR(std::string("[COORDINATOR] Cycle failed: ") + e.what());
            }
        }
        schedule_cycle();
    });
}

void TraversalCoordinator::schedule_poll() {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (state_.load() == CoordinatorState::Stopped) return;

    poll_timer_.expires_after(std::chrono::milliseconds(engine_.polling_interval_ms));
    poll_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        try {
            poll();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("[COORDINATOR] Poll failed: ") + e.what());
        }
        schedule_poll();
    });
}

} // namespace threnody
