/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <libpq-fe.h>

namespace Coalesce {

/**
 * @brief PostgreSQL connection wrapper
 *
 * Every failure surfaces as StorageError carrying the server message.
 * Text-format parameters only; NULL parameters are passed as std::nullopt.
 */
class PostgresConnection {
public:
    using Row = std::vector<std::string>;
    using RowCallback = std::function<void(const Row&)>;
    using Param = std::optional<std::string>;

    /**
     * @brief Connect using environment variables
     *
     * Uses: PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD
     * Defaults: localhost, 5432, coalesce, postgres, (no password)
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
     * @brief Execute a statement, discarding any rows.
     * @return Rows affected (0 for statements that report none)
     */
    size_t execute(const std::string& sql, const std::vector<Param>& params = {});

    /**
     * @brief First column of the first row, if any. A SQL NULL is nullopt.
     */
    std::optional<std::string> query_single(const std::string& sql, const std::vector<Param>& params = {});

    /**
     * @brief Execute query and iterate rows (NULL columns read as "")
     */
    void query(const std::string& sql, const std::vector<Param>& params, const RowCallback& callback);

    /**
     * @brief Row-at-a-time retrieval for result sets too large to buffer.
     */
    void stream_query(const std::string& sql, const std::vector<Param>& params, const RowCallback& callback);

    // COPY FROM STDIN plumbing for BulkCopy
    void copy_data(const char* buffer, int nbytes);
    void copy_end(const char* error_msg = nullptr);

    void begin();
    void commit();
    void rollback();

    /**
     * @brief RAII transaction guard; rolls back unless committed.
     */
    class Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        void commit();
        void rollback();

    private:
        PostgresConnection& conn_;
        bool done_ = false;
    };

    std::string last_error() const;

private:
    void connect(const std::string& conninfo);
    void disconnect();
    void ensure_connected() const;
    PGresult* exec(const std::string& sql, const std::vector<Param>& params);
    void check_result(PGresult* result);

    PGconn* conn_ = nullptr;
    std::string last_error_;
};

} // namespace Coalesce
