/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <database/postgres_connection.hpp>
#include <config/engine_config.hpp>
#include <utils/logger.hpp>

namespace Lexigraph {

namespace {

// Owns a PGresult for the duration of a call so every exit path clears it.
struct ResultGuard {
    PGresult* result;
    ~ResultGuard() { if (result) PQclear(result); }
};

} // namespace

PostgresConnection::PostgresConnection() {
    connect(DatabaseConfig::from_env().conninfo());
}

PostgresConnection::PostgresConnection(const std::string& conninfo) {
    connect(conninfo);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

PostgresConnection::PostgresConnection(PostgresConnection&& other) noexcept
    : conn_(other.conn_), last_error_(std::move(other.last_error_)) {
    other.conn_ = nullptr;
}

PostgresConnection& PostgresConnection::operator=(PostgresConnection&& other) noexcept {
    if (this != &other) {
        disconnect();
        conn_ = other.conn_;
        last_error_ = std::move(other.last_error_);
        other.conn_ = nullptr;
    }
    return *this;
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        Logger::error("PostgreSQL connection failed: " + last_error_);
        throw DatabaseError("PostgreSQL connection failed: " + last_error_);
    }
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

void PostgresConnection::require_connection() const {
    if (!is_connected()) {
        throw DatabaseError("Not connected to database");
    }
}

void PostgresConnection::check_result(PGresult* result) {
    ExecStatusType status = PQresultStatus(result);

    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQclear(result);
        throw DatabaseError("PostgreSQL query failed: " + last_error_);
    }
}

PGresult* PostgresConnection::exec_params(const std::string& sql, const std::vector<std::string>& params) {
    require_connection();

    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& p : params) {
        param_values.push_back(p.c_str());
    }

    PGresult* result = PQexecParams(
        conn_,
        sql.c_str(),
        static_cast<int>(params.size()),
        nullptr,
        param_values.data(),
        nullptr,
        nullptr,
        0  // Text format
    );

    if (!result) {
        last_error_ = PQerrorMessage(conn_);
        throw DatabaseError("PostgreSQL query failed: " + last_error_);
    }

    check_result(result);
    return result;
}

void PostgresConnection::execute(const std::string& sql) {
    require_connection();

    PGresult* result = PQexec(conn_, sql.c_str());
    if (!result) {
        last_error_ = PQerrorMessage(conn_);
        throw DatabaseError("PostgreSQL query failed: " + last_error_);
    }
    check_result(result);
    PQclear(result);
}

void PostgresConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    ResultGuard guard{exec_params(sql, params)};
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql, const std::vector<std::string>& params) {
    ResultGuard guard{exec_params(sql, params)};

    if (PQntuples(guard.result) > 0 && PQnfields(guard.result) > 0 && !PQgetisnull(guard.result, 0, 0)) {
        return std::string(PQgetvalue(guard.result, 0, 0));
    }
    return std::nullopt;
}

void PostgresConnection::query(const std::string& sql, const std::vector<std::string>& params, RowCallback callback) {
    ResultGuard guard{exec_params(sql, params)};

    int nrows = PQntuples(guard.result);
    int nfields = PQnfields(guard.result);

    for (int i = 0; i < nrows; ++i) {
        std::vector<std::string> row;
        row.reserve(nfields);

        for (int j = 0; j < nfields; ++j) {
            row.push_back(PQgetvalue(guard.result, i, j));
        }

        callback(row);
    }
}

void PostgresConnection::query_nullable(const std::string& sql, const std::vector<std::string>& params,
                                        std::function<void(const std::vector<std::optional<std::string>>&)> callback) {
    ResultGuard guard{exec_params(sql, params)};

    int nrows = PQntuples(guard.result);
    int nfields = PQnfields(guard.result);

    for (int i = 0; i < nrows; ++i) {
        std::vector<std::optional<std::string>> row;
        row.reserve(nfields);

        for (int j = 0; j < nfields; ++j) {
            if (PQgetisnull(guard.result, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(PQgetvalue(guard.result, i, j));
            }
        }

        callback(row);
    }
}

std::string PostgresConnection::last_error() const {
    return last_error_;
}

} // namespace Lexigraph
