#pragma once

#include "threnody/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace threnody {

/**
 * Backend contract over the append-only message table.
 *
 * Every read returns only rows with approved = true and deleted_at = NULL.
 * Implementations throw StoreUnavailableError for transient failures
 * (lost connection, timeout) and DatabaseError for anything else.
 */
class MessageStore {
public:
    virtual ~MessageStore() = default;

    // Up to limit messages with id <= min(from_id, ceiling_id), descending by id
    virtual std::vector<Message> range_backward(MessageId from_id, size_t limit, MessageId ceiling_id) = 0;

    // All messages with id > watermark, ascending by id
    virtual std::vector<Message> above(MessageId watermark) = 0;

    // Highest visible id, or 0 when nothing is visible
    virtual MessageId max_id() = 0;

    // Number of visible messages
    virtual int64_t count() = 0;

    // Appends a message and returns it with its assigned id and timestamp
    virtual Message insert(const std::string& content, bool approved) = 0;

    // Cheap liveness check; throws like any other call when the store is down
    virtual void ping() = 0;
};

} // namespace threnody
