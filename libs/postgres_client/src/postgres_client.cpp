#include "postgres_client.hpp"

#include <cstdlib>

#include <glog/logging.h>

namespace ridematch::platform {

// ============================================================================
// Rows and results
// ============================================================================

const char* PostgresRow::raw(const std::string& column) const {
    if (!result_) {
        return nullptr;
    }
    int col = PQfnumber(result_, column.c_str());
    if (col < 0) {
        LOG(WARNING) << "Result has no column " << column;
        return nullptr;
    }
    if (PQgetisnull(result_, row_, col)) {
        return nullptr;
    }
    return PQgetvalue(result_, row_, col);
}

std::string PostgresRow::get_string(const std::string& column) const {
    const char* value = raw(column);
    return value ? std::string(value) : std::string();
}

int PostgresRow::get_int(const std::string& column) const {
    const char* value = raw(column);
    return value ? static_cast<int>(std::strtol(value, nullptr, 10)) : 0;
}

int64_t PostgresRow::get_int64(const std::string& column) const {
    const char* value = raw(column);
    return value ? std::strtoll(value, nullptr, 10) : 0;
}

double PostgresRow::get_double(const std::string& column) const {
    const char* value = raw(column);
    return value ? std::strtod(value, nullptr) : 0.0;
}

bool PostgresRow::is_null(const std::string& column) const {
    return raw(column) == nullptr;
}

PostgresResult::~PostgresResult() {
    if (result_) {
        PQclear(result_);
    }
}

PostgresResult::PostgresResult(PostgresResult&& other) noexcept : result_(other.result_) {
    other.result_ = nullptr;
}

PostgresResult& PostgresResult::operator=(PostgresResult&& other) noexcept {
    if (this != &other) {
        if (result_) {
            PQclear(result_);
        }
        result_ = other.result_;
        other.result_ = nullptr;
    }
    return *this;
}

bool PostgresResult::ok() const {
    if (!result_) {
        return false;
    }
    auto status = PQresultStatus(result_);
    return status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK;
}

std::string PostgresResult::error() const {
    return result_ ? PQresultErrorMessage(result_) : "no connection";
}

int PostgresResult::num_rows() const {
    return result_ ? PQntuples(result_) : 0;
}

int PostgresResult::affected_rows() const {
    if (!result_) {
        return 0;
    }
    const char* count = PQcmdTuples(result_);
    return (count && *count) ? static_cast<int>(std::strtol(count, nullptr, 10)) : 0;
}

// ============================================================================
// Client
// ============================================================================

PostgresClient::PostgresClient(PostgresConfig config) : config_(std::move(config)) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ensure_connected();
}

PostgresClient::~PostgresClient() {
    if (conn_) {
        PQfinish(conn_);
    }
}

bool PostgresClient::ensure_connected() {
    if (conn_ && PQstatus(conn_) == CONNECTION_OK) {
        return true;
    }
    if (conn_) {
        LOG(WARNING) << "PostgreSQL connection lost, reconnecting";
        PQfinish(conn_);
        conn_ = nullptr;
    }

    std::string port = std::to_string(config_.port);
    std::string timeout = std::to_string(config_.connect_timeout_seconds);
    const char* keywords[] = {"host", "port", "dbname", "user", "password",
                              "connect_timeout", nullptr};
    const char* values[] = {config_.host.c_str(), port.c_str(), config_.database.c_str(),
                            config_.user.c_str(), config_.password.c_str(),
                            timeout.c_str(), nullptr};

    conn_ = PQconnectdbParams(keywords, values, 0);
    if (PQstatus(conn_) != CONNECTION_OK) {
        LOG(ERROR) << "PostgreSQL connection to " << config_.host << ":" << config_.port
                   << " failed: " << PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        return false;
    }

    LOG(INFO) << "Connected to PostgreSQL " << config_.database << "@"
              << config_.host << ":" << config_.port;
    return true;
}

bool PostgresClient::is_connected() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

PostgresResult PostgresClient::execute(const std::string& sql,
                                       const std::vector<std::string>& params) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!ensure_connected()) {
        return PostgresResult(nullptr);
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& param : params) {
        values.push_back(param.c_str());
    }

    // Text parameters with server-inferred types, text results
    PostgresResult result(PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()),
                                       nullptr, values.empty() ? nullptr : values.data(),
                                       nullptr, nullptr, 0));
    if (!result.ok()) {
        LOG(ERROR) << "Statement failed: " << result.error();
    }
    return result;
}

std::string PostgresClient::last_error() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return conn_ ? PQerrorMessage(conn_) : "not connected";
}

// ============================================================================
// Transactions
// ============================================================================

PostgresTransaction::PostgresTransaction(PostgresClient& db)
    : db_(db), lock_(db.mutex_) {
    active_ = db_.execute("BEGIN").ok();
    if (!active_) {
        LOG(ERROR) << "BEGIN failed: " << db_.last_error();
    }
}

PostgresTransaction::~PostgresTransaction() {
    if (active_ && !db_.execute("ROLLBACK").ok()) {
        LOG(ERROR) << "ROLLBACK failed: " << db_.last_error();
    }
}

bool PostgresTransaction::commit() {
    if (!active_) {
        return false;
    }
    active_ = false;
    return db_.execute("COMMIT").ok();
}

}  // namespace ridematch::platform
