/**
 * @file helpers.hpp
 * @brief PGresult ownership and parameterised execution for the message store
 *
 * Everything travels in text format. Accessors tolerate NULLs and out of
 * range cells by returning the supplied fallback.
 */

#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>
#include <libpq-fe.h>

namespace threnody::db {

class Result {
public:
    Result() = default;
    explicit Result(PGresult* res) : res_(res) {}
    ~Result() { clear(); }

    Result(Result&& other) noexcept : res_(other.res_) { other.res_ = nullptr; }
    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            clear();
            res_ = other.res_;
            other.res_ = nullptr;
        }
        return *this;
    }
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    PGresult* get() const { return res_; }

    // Statement completed, with or without rows
    bool ok() const {
        if (!res_) return false;
        ExecStatusType status = PQresultStatus(res_);
        return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
    }

    int ntuples() const { return res_ ? PQntuples(res_) : 0; }

    std::string error_message() const {
        return res_ ? PQresultErrorMessage(res_) : "no result (out of memory or lost connection)";
    }

    // Five-character SQLSTATE, empty when the server never answered
    std::string sqlstate() const {
        const char* state = res_ ? PQresultErrorField(res_, PG_DIAG_SQLSTATE) : nullptr;
        return state ? state : "";
    }

    std::string str(int row, int col, const std::string& fallback = "") const {
        const char* v = cell(row, col);
        return v ? std::string(v) : fallback;
    }

    int64_t int64(int row, int col, int64_t fallback = 0) const {
        const char* v = cell(row, col);
        if (!v || *v == '\0') return fallback;
        char* end = nullptr;
        long long parsed = std::strtoll(v, &end, 10);
        return end && *end == '\0' ? static_cast<int64_t>(parsed) : fallback;
    }

    // PostgreSQL renders booleans as 't' / 'f'
    bool boolean(int row, int col, bool fallback = false) const {
        const char* v = cell(row, col);
        if (!v || *v == '\0') return fallback;
        return *v == 't' || *v == 'T' || *v == '1';
    }

private:
    const char* cell(int row, int col) const {
        if (!res_ || row < 0 || col < 0 || row >= PQntuples(res_) || col >= PQnfields(res_)) return nullptr;
        if (PQgetisnull(res_, row, col)) return nullptr;
        return PQgetvalue(res_, row, col);
    }

    void clear() {
        if (res_) PQclear(res_);
        res_ = nullptr;
    }

    PGresult* res_ = nullptr;
};

// Runs sql with $1..$n bound from params (text format, results as text)
inline Result exec_params(PGconn* conn, const char* sql, const std::vector<std::string>& params) {
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) values.push_back(p.c_str());
    return Result(PQexecParams(conn, sql, static_cast<int>(values.size()), nullptr,
                               values.empty() ? nullptr : values.data(), nullptr, nullptr, 0));
}

} // namespace threnody::db
