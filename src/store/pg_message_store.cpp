#include "threnody/store/pg_message_store.hpp"
#include "threnody/error.hpp"
#include "threnody/logging.hpp"

namespace threnody {

namespace {

// Column order shared by every SELECT below
constexpr const char* kColumns =
    "id, content, (extract(epoch from created_at) * 1000)::bigint AS created_ms, approved";

constexpr const char* kVisible = "approved = true AND deleted_at IS NULL";

const std::string kRangeBackwardSql =
    std::string("SELECT ") + kColumns + " FROM messages WHERE id <= $1 AND id <= $2 AND " + kVisible +
    " ORDER BY id DESC LIMIT $3";

const std::string kAboveSql =
    std::string("SELECT ") + kColumns + " FROM messages WHERE id > $1 AND " + kVisible +
    " ORDER BY id ASC";

const std::string kMaxIdSql =
    std::string("SELECT COALESCE(MAX(id), 0) FROM messages WHERE ") + kVisible;

const std::string kCountSql =
    std::string("SELECT COUNT(*) FROM messages WHERE ") + kVisible;

const std::string kInsertSql =
    "INSERT INTO messages (content, approved) VALUES ($1, $2) "
    "RETURNING id, content, (extract(epoch from created_at) * 1000)::bigint AS created_ms, approved";

// Class 08 is "connection exception"; 57P01..57P03 are admin shutdown / cannot connect now
bool is_transient_sqlstate(const std::string& state) {
    if (state.size() != 5) return true;  // No SQLSTATE: the failure happened client side
    if (state.compare(0, 2, "08") == 0) return true;
    if (state == "57P01" || state == "57P02" || state == "57P03") return true;
    if (state == "40001" || state == "40P01") return true;  // serialization failure, deadlock
    return false;
}

} // namespace

PgMessageStore::PgMessageStore(const DatabaseConfig& config)
    : conninfo_(config.to_conninfo()) {}

PGconn* PgMessageStore::ensure_connected() {
    if (!conn_.get()) {
        conn_ = db::Connection(conninfo_);
    } else if (!conn_.ok()) {
        LOG_WARNING("[STORE] Connection lost, resetting");
        conn_.reset();
    }
    if (!conn_.ok()) {
        throw StoreUnavailableError(std::string("Cannot connect to PostgreSQL: ") + conn_.error(),
                                    "PgMessageStore",
                                    "Check THRENODY_DB_* settings and that the server is reachable");
    }
    return conn_.get();
}

db::Result PgMessageStore::run(const char* sql, const std::vector<std::string>& params, const char* op) {
    PGconn* conn = ensure_connected();
    db::Result res = db::exec_params(conn, sql, params);
    if (res.ok()) {
        return res;
    }

    std::string message = std::string(op) + " failed: " + res.error_message();
    if (PQstatus(conn) != CONNECTION_OK || is_transient_sqlstate(res.sqlstate())) {
        throw StoreUnavailableError(message, "PgMessageStore");
    }
    throw DatabaseError(message, "PgMessageStore", "Verify the messages table matches sql/001_messages.sql");
}

std::vector<Message> PgMessageStore::read_messages(const db::Result& res) {
    std::vector<Message> messages;
    int rows = res.ntuples();
    messages.reserve(static_cast<size_t>(rows));
    for (int i = 0; i < rows; ++i) {
        Message msg;
        msg.id = res.int64(i, 0);
        msg.content = res.str(i, 1);
        msg.created_at = from_epoch_ms(res.int64(i, 2));
        msg.approved = res.boolean(i, 3);
        messages.push_back(std::move(msg));
    }
    return messages;
}

std::vector<Message> PgMessageStore::range_backward(MessageId from_id, size_t limit, MessageId ceiling_id) {
    if (limit == 0) return {};
    std::lock_guard<std::mutex> lock(mutex_);
    db::Result res = run(kRangeBackwardSql.c_str(),
                         {std::to_string(from_id), std::to_string(ceiling_id), std::to_string(limit)},
                         "range_backward");
    return read_messages(res);
}

std::vector<Message> PgMessageStore::above(MessageId watermark) {
    std::lock_guard<std::mutex> lock(mutex_);
    db::Result res = run(kAboveSql.c_str(), {std::to_string(watermark)}, "above");
    return read_messages(res);
}

MessageId PgMessageStore::max_id() {
    std::lock_guard<std::mutex> lock(mutex_);
    db::Result res = run(kMaxIdSql.c_str(), {}, "max_id");
    return res.int64(0, 0);
}

int64_t PgMessageStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    db::Result res = run(kCountSql.c_str(), {}, "count");
    return res.int64(0, 0);
}

Message PgMessageStore::insert(const std::string& content, bool approved) {
    std::lock_guard<std::mutex> lock(mutex_);
    db::Result res = run(kInsertSql.c_str(), {content, approved ? "true" : "false"}, "insert");
    auto inserted = read_messages(res);
    if (inserted.empty()) {
        throw DatabaseError("insert returned no row", "PgMessageStore");
    }
    return inserted.front();
}

void PgMessageStore::ping() {
    std::lock_guard<std::mutex> lock(mutex_);
    run("SELECT 1", {}, "ping");
}

} // namespace threnody
