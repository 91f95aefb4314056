/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <database/postgres_connection.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <cstdlib>
#include <sstream>

namespace Coalesce {

PostgresConnection::PostgresConnection() {
    std::ostringstream conninfo;

    const char* host = std::getenv("PGHOST");
    const char* port = std::getenv("PGPORT");
    const char* dbname = std::getenv("PGDATABASE");
    const char* user = std::getenv("PGUSER");
    const char* password = std::getenv("PGPASSWORD");

    conninfo << "host=" << (host ? host : "localhost") << " ";
    conninfo << "port=" << (port ? port : "5432") << " ";
    conninfo << "dbname=" << (dbname ? dbname : "coalesce") << " ";
    conninfo << "user=" << (user ? user : "postgres") << " ";

    if (password) {
        conninfo << "password=" << password << " ";
    }

    connect(conninfo.str());
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
        throw StorageError("PostgreSQL connection failed: " + last_error_);
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

void PostgresConnection::ensure_connected() const {
    if (!is_connected()) {
        throw StorageError("not connected to database");
    }
}

void PostgresConnection::check_result(PGresult* result) {
    ExecStatusType status = PQresultStatus(result);

    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK &&
        status != PGRES_COPY_IN && status != PGRES_SINGLE_TUPLE) {
        last_error_ = PQerrorMessage(conn_);
        PQclear(result);
        throw StorageError("PostgreSQL query failed: " + last_error_);
    }
}

PGresult* PostgresConnection::exec(const std::string& sql, const std::vector<Param>& params) {
    ensure_connected();

    if (params.empty()) {
        PGresult* result = PQexec(conn_, sql.c_str());
        check_result(result);
        return result;
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }

    PGresult* result = PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()),
                                    nullptr, values.data(), nullptr, nullptr, 0);
    check_result(result);
    return result;
}

size_t PostgresConnection::execute(const std::string& sql, const std::vector<Param>& params) {
    PGresult* result = exec(sql, params);
    const char* affected = PQcmdTuples(result);
    size_t count = (affected && *affected) ? std::strtoull(affected, nullptr, 10) : 0;
    PQclear(result);
    return count;
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql, const std::vector<Param>& params) {
    PGresult* result = exec(sql, params);

    std::optional<std::string> value;
    if (PQntuples(result) > 0 && PQnfields(result) > 0 && !PQgetisnull(result, 0, 0)) {
        value = PQgetvalue(result, 0, 0);
    }

    PQclear(result);
    return value;
}

void PostgresConnection::query(const std::string& sql, const std::vector<Param>& params, const RowCallback& callback) {
    PGresult* result = exec(sql, params);

    const int nrows = PQntuples(result);
    const int nfields = PQnfields(result);

    Row row;
    row.reserve(nfields);
    for (int i = 0; i < nrows; ++i) {
        row.clear();
        for (int j = 0; j < nfields; ++j) {
            row.push_back(PQgetvalue(result, i, j));
        }
        try {
            callback(row);
        } catch (...) {
            PQclear(result);
            throw;
        }
    }

    PQclear(result);
}

void PostgresConnection::stream_query(const std::string& sql, const std::vector<Param>& params,
                                      const RowCallback& callback) {
    ensure_connected();

    std::vector<const char*> values;
    for (const auto& p : params) values.push_back(p ? p->c_str() : nullptr);

    if (PQsendQueryParams(conn_, sql.c_str(), static_cast<int>(values.size()), nullptr,
                          values.empty() ? nullptr : values.data(), nullptr, nullptr, 0) == 0) {
        last_error_ = PQerrorMessage(conn_);
        throw StorageError("PQsendQueryParams failed: " + last_error_);
    }

    if (PQsetSingleRowMode(conn_) == 0) {
        throw StorageError("PQsetSingleRowMode failed");
    }

    // Drain every result even after a failure so the connection stays usable
    std::optional<StorageError> failure;
    PGresult* res;
    while ((res = PQgetResult(conn_)) != nullptr) {
        ExecStatusType status = PQresultStatus(res);

        if (status == PGRES_SINGLE_TUPLE && !failure) {
            const int nfields = PQnfields(res);
            Row row;
            row.reserve(nfields);
            for (int i = 0; i < nfields; ++i) {
                row.push_back(PQgetvalue(res, 0, i));
            }
            try {
                callback(row);
            } catch (const StorageError& e) {
                failure = e;
            }
        } else if (status != PGRES_TUPLES_OK && status != PGRES_SINGLE_TUPLE && !failure) {
            last_error_ = PQerrorMessage(conn_);
            failure = StorageError("PostgreSQL query failed: " + last_error_);
        }
        PQclear(res);
    }

    if (failure) throw *failure;
}

void PostgresConnection::copy_data(const char* buffer, int nbytes) {
    ensure_connected();

    if (PQputCopyData(conn_, buffer, nbytes) == -1) {
        last_error_ = PQerrorMessage(conn_);
        throw StorageError("COPY data failed: " + last_error_);
    }
}

void PostgresConnection::copy_end(const char* error_msg) {
    ensure_connected();

    if (PQputCopyEnd(conn_, error_msg) == -1) {
        last_error_ = PQerrorMessage(conn_);
        throw StorageError("COPY end failed: " + last_error_);
    }

    // The COPY command's own result follows the end marker
    PGresult* res = PQgetResult(conn_);
    check_result(res);
    PQclear(res);
    while ((res = PQgetResult(conn_)) != nullptr) PQclear(res);
}

void PostgresConnection::begin() {
    execute("BEGIN");
}

void PostgresConnection::commit() {
    execute("COMMIT");
}

void PostgresConnection::rollback() {
    execute("ROLLBACK");
}

std::string PostgresConnection::last_error() const {
    return last_error_;
}

// Transaction RAII
PostgresConnection::Transaction::Transaction(PostgresConnection& conn) : conn_(conn) {
    conn_.begin();
}

PostgresConnection::Transaction::~Transaction() {
    if (done_) return;
    try {
        conn_.rollback();
    } catch (const StorageError& e) {
        Logger::warn(std::string("Rollback failed: ") + e.what());
    }
}

void PostgresConnection::Transaction::commit() {
    conn_.commit();
    done_ = true;
}

void PostgresConnection::Transaction::rollback() {
    conn_.rollback();
    done_ = true;
}

} // namespace Coalesce
