#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <libpq-fe.h>

namespace ridematch::platform {

struct PostgresConfig {
    std::string host = "localhost";
    int port = 5432;
    std::string database = "ridematch";
    std::string user = "ridematch";
    std::string password = "ridematch_dev";
    int connect_timeout_seconds = 10;
};

/// One row of a result, read by column name. NULL and unknown columns
/// read as empty / zero.
class PostgresRow {
public:
    PostgresRow(const PGresult* result, int row) : result_(result), row_(row) {}

    std::string get_string(const std::string& column) const;
    int get_int(const std::string& column) const;
    int64_t get_int64(const std::string& column) const;
    double get_double(const std::string& column) const;
    bool is_null(const std::string& column) const;

private:
    /// Text value, nullptr for NULL or an unknown column
    const char* raw(const std::string& column) const;

    const PGresult* result_;
    int row_;
};

/// Owns a PGresult
class PostgresResult {
public:
    explicit PostgresResult(PGresult* result) : result_(result) {}
    ~PostgresResult();

    PostgresResult(PostgresResult&& other) noexcept;
    PostgresResult& operator=(PostgresResult&& other) noexcept;
    PostgresResult(const PostgresResult&) = delete;
    PostgresResult& operator=(const PostgresResult&) = delete;

    bool ok() const;
    std::string error() const;

    int num_rows() const;
    PostgresRow row(int index) const { return PostgresRow(result_, index); }

    /// Rows touched by INSERT / UPDATE / DELETE
    int affected_rows() const;

    class Iterator {
    public:
        Iterator(const PGresult* result, int row) : result_(result), row_(row) {}
        PostgresRow operator*() const { return PostgresRow(result_, row_); }
        Iterator& operator++() { ++row_; return *this; }
        bool operator!=(const Iterator& other) const { return row_ != other.row_; }

    private:
        const PGresult* result_;
        int row_;
    };

    Iterator begin() const { return Iterator(result_, 0); }
    Iterator end() const { return Iterator(result_, num_rows()); }

private:
    PGresult* result_;
};

/**
 * A single libpq connection shared by all callers.
 *
 * Each statement holds the connection lock, and a PostgresTransaction holds
 * it for its whole lifetime, so statements from other threads never land
 * inside someone else's transaction. A dropped connection is re-opened on
 * the next statement.
 */
class PostgresClient {
public:
    explicit PostgresClient(PostgresConfig config);
    ~PostgresClient();

    PostgresClient(const PostgresClient&) = delete;
    PostgresClient& operator=(const PostgresClient&) = delete;

    bool is_connected() const;

    /// Parameters are sent separately from the statement text ($1, $2, ...)
    PostgresResult execute(const std::string& sql,
                           const std::vector<std::string>& params = {});

    std::string last_error() const;

private:
    friend class PostgresTransaction;

    /// Caller holds mutex_
    bool ensure_connected();

    PostgresConfig config_;
    PGconn* conn_ = nullptr;
    mutable std::recursive_mutex mutex_;
};

/// BEGIN on construction; ROLLBACK on destruction unless commit() ran
class PostgresTransaction {
public:
    explicit PostgresTransaction(PostgresClient& db);
    ~PostgresTransaction();

    PostgresTransaction(const PostgresTransaction&) = delete;
    PostgresTransaction& operator=(const PostgresTransaction&) = delete;

    bool active() const { return active_; }
    bool commit();

private:
    PostgresClient& db_;
    std::unique_lock<std::recursive_mutex> lock_;
    bool active_ = false;
};

}  // namespace ridematch::platform
