#pragma once

#include "threnody/config.hpp"
#include "threnody/store_gateway.hpp"
#include "threnody/types.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_set>
#include <vector>

namespace threnody {

/**
 * Supplies messages to the working set from two independent cursors.
 *
 * The watermark is the highest id ever observed; anything above it is new
 * and goes through the priority queue. The historical cursor walks down from
 * the watermark and wraps back to the current maximum once it runs out.
 * next_batch() always drains new messages before touching history, which
 * bounds how long a submission waits to be shown.
 *
 * Not thread-safe: the owning coordinator serialises all calls.
 */
class PoolManager {
public:
    // Returns true for ids the caller already holds; history skips them
    using HistoryFilter = std::function<bool(MessageId)>;

    PoolManager(std::shared_ptr<StoreGateway> gateway, const EngineConfig& config);

    // Sets watermark = max_id() and starts the historical cursor there.
    // Throws StoreUnavailableError when the store cannot be reached.
    void initialize();
    bool initialized() const { return initialized_; }

    // Up to count distinct messages: queued first, then fresh rows above the
    // watermark, then history. Queue and fresh ids are reported as priority.
    // History rows matching skip are passed over and the scan continues, for
    // at most one wrap. Returns fewer than count when the store cannot
    // supply more.
    Batch next_batch(size_t count, const HistoryFilter& skip = HistoryFilter());

    // Queues a just-submitted message when it lies above the watermark.
    // Returns false when the message was ignored.
    bool mark_new_submission(const Message& message);

    // Folds rows above the watermark into the queue; returns how many were queued
    size_t poll();

    PoolStats stats() const;

    // Drops queued messages and forgets both cursors
    void reset();

private:
    void enqueue(const Message& message);
    void advance_watermark(MessageId id);
    void fill_from_history(size_t deficit, Batch& batch, std::unordered_set<MessageId>& seen,
                           const HistoryFilter& skip);

    std::shared_ptr<StoreGateway> gateway_;
    EngineConfig config_;

    bool initialized_ = false;
    std::optional<MessageId> historical_cursor_;
    MessageId watermark_ = 0;

    // Ascending by id; overflow drops from the front
    std::deque<Message> queue_;
    uint64_t dropped_total_ = 0;
};

} // namespace threnody
