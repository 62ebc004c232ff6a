#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace threnody {

using MessageId = int64_t;
using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// Maximum content length in code points, enforced at intake.
constexpr size_t kMaxContentLength = 280;

/**
 * A single submitted message. Immutable once admitted to the store.
 * Only approved, non-deleted messages are ever visible to the engine.
 */
struct Message {
    MessageId id = 0;
    std::string content;
    Timestamp created_at{};
    bool approved = false;
    std::optional<Timestamp> deleted_at;

    bool is_visible() const noexcept { return approved && !deleted_at.has_value(); }
};

struct RelatedMessage {
    Message message;
    double similarity = 0.0;
};

/**
 * One displayable group. A cluster without a focus is the placeholder
 * emitted while the working set is empty.
 */
struct MessageCluster {
    std::optional<Message> focus;
    std::vector<RelatedMessage> related;
    std::optional<Message> next;
    uint32_t duration_ms = 0;
    uint64_t total_shown = 0;
    Timestamp timestamp{};

    bool is_placeholder() const noexcept { return !focus.has_value(); }
    std::optional<MessageId> focus_id() const {
        return focus ? std::optional<MessageId>(focus->id) : std::nullopt;
    }
    std::optional<MessageId> next_id() const {
        return next ? std::optional<MessageId>(next->id) : std::nullopt;
    }
};

enum class ChangeReason {
    Initialization,
    Cycle
};

struct WorkingSetChange {
    std::vector<MessageId> removed;
    std::vector<Message> added;
    // Subset of added that arrived through the priority path
    std::vector<MessageId> priority_added;
    ChangeReason reason = ChangeReason::Cycle;
};

// Result of PoolManager::next_batch
struct Batch {
    std::vector<Message> messages;
    std::vector<MessageId> priority_ids;
};

struct PoolStats {
    std::optional<MessageId> historical_cursor;
    MessageId watermark = 0;
    size_t queue_depth = 0;
    uint64_t dropped_total = 0;
    uint64_t estimated_queue_wait_ms = 0;
};

inline const char* change_reason_str(ChangeReason reason) {
    switch (reason) {
        case ChangeReason::Initialization: return "initialization";
        case ChangeReason::Cycle: return "cycle";
    }
    return "unknown";
}

inline int64_t to_epoch_ms(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

inline Timestamp from_epoch_ms(int64_t ms) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

} // namespace threnody
