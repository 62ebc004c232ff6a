#include "threnody/pool_manager.hpp"
#include "threnody/error.hpp"
#include "threnody/logging.hpp"
#include "threnody/metrics.hpp"

#include <algorithm>

namespace threnody {

PoolManager::PoolManager(std::shared_ptr<StoreGateway> gateway, const EngineConfig& config)
    : gateway_(std::move(gateway)), config_(config) {
    THRENODY_CHECK_ARGUMENT(gateway_ != nullptr, "PoolManager requires a store gateway");
    LOG_DEBUG("[POOL_MANAGER] Created (working set " + std::to_string(config_.working_set_size) +
              ", queue max " + std::to_string(config_.priority_queue_max_size) + ")");
}

void PoolManager::initialize() {
    MessageId max_id = gateway_->max_id();

    watermark_ = max_id;
    if (max_id == 0) {
        historical_cursor_.reset();
        LOG_INFO("[POOL_MANAGER] Store is empty, cursors idle");
    } else {
        historical_cursor_ = max_id;
        LOG_INFO("[POOL_MANAGER] Cursors initialised at " + std::to_string(max_id));
    }
    initialized_ = true;
}

Batch PoolManager::next_batch(size_t count, const HistoryFilter& skip) {
    THRENODY_CHECK(initialized_, ErrorCode::INTERNAL_ERROR, "next_batch called before initialize");

    Batch batch;
    std::unordered_set<MessageId> seen;
    if (count == 0) return batch;

    // Stage 1: drain the queue, lowest id first
    while (batch.messages.size() < count && !queue_.empty()) {
        Message msg = std::move(queue_.front());
        queue_.pop_front();
        if (!seen.insert(msg.id).second) continue;
        batch.priority_ids.push_back(msg.id);
        batch.messages.push_back(std::move(msg));
    }
    size_t from_queue = batch.messages.size();

    try {
        // Stage 2: rows that arrived since the last look
        size_t from_fresh = 0;
        if (batch.messages.size() < count) {
            std::vector<Message> fresh = gateway_->above(watermark_);
            for (const auto& msg : fresh) {
                advance_watermark(msg.id);
                if (batch.messages.size() < count && seen.insert(msg.id).second) {
                    batch.priority_ids.push_back(msg.id);
                    batch.messages.push_back(msg);
                    ++from_fresh;
                } else {
                    enqueue(msg);
                }
            }
        }

        // Stage 3: history
        size_t before_history = batch.messages.size();
        if (batch.messages.size() < count) {
            fill_from_history(count - batch.messages.size(), batch, seen, skip);
        }

        LOG_DEBUG("[POOL_MANAGER] Batch of " + std::to_string(batch.messages.size()) + "/" +
                  std::to_string(count) + " (queue " + std::to_string(from_queue) +
                  ", fresh " + std::to_string(from_fresh) +
                  ", history " + std::to_string(batch.messages.size() - before_history) +
                  ", queue depth " + std::to_string(queue_.size()) + ")");
    } catch (const ThrenodyException& e) {
        // Messages already taken from the queue must not be lost, whatever the failure
        if (batch.messages.empty()) {
            throw;
        }
        LOG_WARNING("[POOL_MANAGER] Store error, returning partial batch of " +
                    std::to_string(batch.messages.size()) + ": " + e.what());
    }

    Metrics::getInstance().set_gauge("queue_depth", static_cast<double>(queue_.size()));
    return batch;
}

void PoolManager::fill_from_history(size_t deficit, Batch& batch, std::unordered_set<MessageId>& seen,
                                    const HistoryFilter& skip) {
    bool wrapped = false;
    size_t page = 0;
    size_t max_page = config_.working_set_size + deficit;

    while (deficit > 0) {
        if (!historical_cursor_) {
            // One wrap per call; a second exhaustion means the store has nothing more to give
            if (wrapped) return;
            MessageId max_id = gateway_->max_id();
            if (max_id == 0) {
                LOG_DEBUG("[POOL_MANAGER] Store still empty");
                return;
            }
            LOG_INFO("[POOL_MANAGER] Historical cursor exhausted, recycling from " + std::to_string(max_id));
            historical_cursor_ = max_id;
            wrapped = true;
        }

        size_t requested = std::max(deficit, page);
        std::vector<Message> rows = gateway_->range_backward(*historical_cursor_, requested, watermark_);

        size_t examined = 0;
        size_t skipped = 0;
        for (const auto& msg : rows) {
            if (deficit == 0) break;
            ++examined;
            if ((skip && skip(msg.id)) || !seen.insert(msg.id).second) {
                ++skipped;
                continue;
            }
            batch.messages.push_back(msg);
            --deficit;
        }

        if (examined > 0) {
            MessageId last = rows[examined - 1].id;
            if (last > 1) {
                historical_cursor_ = last - 1;
            } else {
                historical_cursor_.reset();
            }
        }
        // A short read that was fully examined means nothing is left below the cursor
        if (rows.size() < requested && examined == rows.size()) {
            historical_cursor_.reset();
        }
        if (skipped > 0) {
            page = std::min(max_page, requested * 2);
        }
    }
}

bool PoolManager::mark_new_submission(const Message& message) {
    if (!message.is_visible()) {
        LOG_DEBUG("[POOL_MANAGER] Ignoring submission " + std::to_string(message.id) + " (not visible)");
        return false;
    }
    if (message.id <= watermark_) {
        LOG_DEBUG("[POOL_MANAGER] Submission " + std::to_string(message.id) +
                  " already below watermark " + std::to_string(watermark_));
        return false;
    }
    enqueue(message);
    advance_watermark(message.id);
    LOG_INFO("[POOL_MANAGER] Queued submission " + std::to_string(message.id) +
             " (queue " + std::to_string(queue_.size()) + ")");
    return true;
}

size_t PoolManager::poll() {
    if (!initialized_) return 0;

    std::vector<Message> fresh = gateway_->above(watermark_);
    for (const auto& msg : fresh) {
        enqueue(msg);
        advance_watermark(msg.id);
    }
    if (!fresh.empty()) {
        LOG_INFO("[POOL_MANAGER] Found " + std::to_string(fresh.size()) + " new messages (queue " +
                 std::to_string(queue_.size()) + ", watermark " + std::to_string(watermark_) + ")");
    }
    Metrics::getInstance().set_gauge("queue_depth", static_cast<double>(queue_.size()));
    return fresh.size();
}

void PoolManager::enqueue(const Message& message) {
    auto pos = std::lower_bound(queue_.begin(), queue_.end(), message.id,
                                [](const Message& m, MessageId id) { return m.id < id; });
    if (pos != queue_.end() && pos->id == message.id) {
        return;
    }
    queue_.insert(pos, message);

    size_t max_size = config_.priority_queue_max_size;
    if (queue_.size() > max_size) {
        size_t overflow = queue_.size() - max_size;
        std::string ids;
        for (size_t i = 0; i < overflow; ++i) {
            if (i > 0) ids += ",";
            ids += std::to_string(queue_.front().id);
            queue_.pop_front();
        }
        dropped_total_ += overflow;
        Metrics::getInstance().increment_counter("queue_dropped", static_cast<int64_t>(overflow));
        LOG_WARNING("[POOL_MANAGER] Queue overflow: dropped " + std::to_string(overflow) +
                    " oldest messages [" + ids + "]");
    }
}

void PoolManager::advance_watermark(MessageId id) {
    if (id > watermark_) {
        watermark_ = id;
    }
}

PoolStats PoolManager::stats() const {
    PoolStats stats;
    stats.historical_cursor = historical_cursor_;
    stats.watermark = watermark_;
    stats.queue_depth = queue_.size();
    stats.dropped_total = dropped_total_;

    if (!queue_.empty()) {
        uint64_t slots_per_cycle = std::max<uint32_t>(1, config_.cluster_size - 1);
        uint64_t cycles = (queue_.size() + slots_per_cycle - 1) / slots_per_cycle;
        stats.estimated_queue_wait_ms = cycles * config_.cluster_duration_ms;
    }
    return stats;
}

void PoolManager::reset() {
    queue_.clear();
    historical_cursor_.reset();
    watermark_ = 0;
    initialized_ = false;
}

} // namespace threnody
