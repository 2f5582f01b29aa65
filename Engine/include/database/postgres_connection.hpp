/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <export.hpp>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <stdexcept>
#include <libpq-fe.h>

namespace Lexigraph {

/**
 * @brief Raised for connection failures and failed statements.
 */
class DatabaseError : public std::runtime_error {
public:
    explicit DatabaseError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief PostgreSQL connection wrapper
 *
 * One connection per thread: a PGconn must not be used concurrently.
 */
class LEXIGRAPH_API PostgresConnection {
public:
    using RowCallback = std::function<void(const std::vector<std::string>&)>;

    /**
     * @brief Connect using DatabaseConfig::from_env()
     *
     * Uses: LEXIGRAPH_DB_URL, or PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD
     */
    PostgresConnection();

    /**
     * @brief Connect with explicit connection string
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    // No copy
    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    // Move OK
    PostgresConnection(PostgresConnection&& other) noexcept;
    PostgresConnection& operator=(PostgresConnection&& other) noexcept;

    bool is_connected() const;

    /**
     * @brief Execute statement (no results expected)
     */
    void execute(const std::string& sql);
    void execute(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute query and return the first column of the first row
     */
    std::optional<std::string> query_single(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute query with params and iterate rows
     *
     * NULL columns arrive as empty strings; use query_nullable() when the
     * distinction matters.
     */
    void query(const std::string& sql, const std::vector<std::string>& params, RowCallback callback);

    /**
     * @brief Like query(), but NULL columns arrive as std::nullopt
     */
    void query_nullable(const std::string& sql, const std::vector<std::string>& params,
                        std::function<void(const std::vector<std::optional<std::string>>&)> callback);

    std::string last_error() const;

private:
    void connect(const std::string& conninfo);
    void disconnect();
    void require_connection() const;
    PGresult* exec_params(const std::string& sql, const std::vector<std::string>& params);
    void check_result(PGresult* result);

    PGconn* conn_ = nullptr;
    std::string last_error_;
};

} // namespace Lexigraph
