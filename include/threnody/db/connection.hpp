#pragma once

#include <string>
#include <libpq-fe.h>

namespace threnody::db {

// Owns one PGconn. Move-only; PQfinish on destruction.
class Connection {
public:
    Connection() = default;
    explicit Connection(const std::string& conninfo) : conn_(PQconnectdb(conninfo.c_str())) {}
    ~Connection() { close(); }

    Connection(Connection&& other) noexcept : conn_(other.conn_) { other.conn_ = nullptr; }
    Connection& operator=(Connection&& other) noexcept {
        if (this != &other) {
            close();
            conn_ = other.conn_;
            other.conn_ = nullptr;
        }
        return *this;
    }
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    PGconn* get() const { return conn_; }

    bool ok() const { return conn_ && PQstatus(conn_) == CONNECTION_OK; }

    // PQreset reconnects with the parameters of the original PQconnectdb
    bool reset() {
        if (!conn_) return false;
        PQreset(conn_);
        return ok();
    }

    const char* error() const { return conn_ ? PQerrorMessage(conn_) : "not connected"; }

private:
    void close() {
        if (conn_) PQfinish(conn_);
        conn_ = nullptr;
    }

    PGconn* conn_ = nullptr;
};

} // namespace threnody::db
