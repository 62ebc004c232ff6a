#pragma once

#include "threnody/config.hpp"
#include "threnody/db/connection.hpp"
#include "threnody/db/helpers.hpp"
#include "threnody/store/message_store.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace threnody {

/**
 * MessageStore over the PostgreSQL `messages` table (see sql/001_messages.sql).
 * One connection, serialised by a mutex; a dropped connection is reset on
 * the next call.
 */
class PgMessageStore : public MessageStore {
public:
    explicit PgMessageStore(const DatabaseConfig& config);

    std::vector<Message> range_backward(MessageId from_id, size_t limit, MessageId ceiling_id) override;
    std::vector<Message> above(MessageId watermark) override;
    MessageId max_id() override;
    int64_t count() override;
    Message insert(const std::string& content, bool approved) override;
    void ping() override;

private:
    // Connects or resets as needed; throws StoreUnavailableError on failure
    PGconn* ensure_connected();

    // Runs sql and maps failures to StoreUnavailableError / DatabaseError
    db::Result run(const char* sql, const std::vector<std::string>& params, const char* op);

    static std::vector<Message> read_messages(const db::Result& res);

    std::string conninfo_;
    db::Connection conn_;
    std::mutex mutex_;
};

} // namespace threnody
