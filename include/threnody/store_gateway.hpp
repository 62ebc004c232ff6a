#pragma once

#include "threnody/config.hpp"
#include "threnody/store/message_store.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace threnody {

/**
 * Retrying adapter over a MessageStore.
 *
 * Reads are retried on StoreUnavailableError with capped exponential backoff
 * and rethrown as StoreUnavailableError once attempts run out. Results are
 * re-filtered, re-ordered and clipped here so callers never see a row the
 * backend should not have returned.
 */
class StoreGateway {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    StoreGateway(std::shared_ptr<MessageStore> store, const RetryConfig& retry);
    StoreGateway(std::shared_ptr<MessageStore> store, const RetryConfig& retry, Sleeper sleeper);

    // Up to limit visible messages with id <= from_id and id <= ceiling_id, descending
    std::vector<Message> range_backward(MessageId from_id, size_t limit, MessageId ceiling_id);

    // Visible messages with id > watermark, ascending
    std::vector<Message> above(MessageId watermark);

    // Highest visible id, or 0
    MessageId max_id();

    // Number of visible messages
    int64_t count();

    // Single attempt; inserts are not idempotent
    Message insert(const std::string& content, bool approved);

    // True when the store answers a ping within the retry budget
    bool health_check();

    // Delay before retry number `attempt` (1-based)
    std::chrono::milliseconds backoff_delay(uint32_t attempt) const;

private:
    template <typename Fn>
    auto with_retry(const char* op, Fn&& fn) -> decltype(fn());

    std::shared_ptr<MessageStore> store_;
    RetryConfig retry_;
    Sleeper sleeper_;
};

} // namespace threnody
