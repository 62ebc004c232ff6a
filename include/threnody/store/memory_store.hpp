#pragma once

#include "threnody/store/message_store.hpp"

#include <map>
#include <mutex>

namespace threnody {

/**
 * In-process message table. Backs the simulator, the demo mode of the CLI
 * and the engine tests. Rows can be hidden or soft-deleted after insertion
 * to exercise the visibility filter.
 */
class MemoryMessageStore : public MessageStore {
public:
    MemoryMessageStore() = default;

    std::vector<Message> range_backward(MessageId from_id, size_t limit, MessageId ceiling_id) override;
    std::vector<Message> above(MessageId watermark) override;
    MessageId max_id() override;
    int64_t count() override;
    Message insert(const std::string& content, bool approved) override;
    void ping() override;

    // Insert with an explicit creation time (seeding)
    Message insert_at(const std::string& content, Timestamp created_at, bool approved = true);

    // Moderation helpers: both keep the row but hide it from reads
    bool soft_delete(MessageId id);
    bool set_approved(MessageId id, bool approved);

    // Total rows including hidden ones
    size_t row_count() const;

private:
    mutable std::mutex mutex_;
    std::map<MessageId, Message> rows_;
    MessageId next_id_ = 1;
};

// Fills store with count approved messages spread over the last 30 days.
// Deterministic for a given seed.
void seed_store(MemoryMessageStore& store, size_t count, uint32_t seed);

} // namespace threnody
