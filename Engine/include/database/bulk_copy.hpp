#pragma once

#include <database/postgres_connection.hpp>
#include <atomic>
#include <sstream>
#include <string>
#include <vector>

namespace Coalesce {

/**
 * @brief Stream many rows into Postgres using COPY.
 *
 * Usage:
 *   BulkCopy bc(conn);
 *   bc.begin_table("schema.table", {"col1","col2",...});
 *   for (...) bc.add_row({...});
 *   size_t inserted = bc.flush();
 *
 * Rows are COPYed into a temp table shaped like the target and moved over
 * with INSERT ... SELECT plus the conflict clause, so duplicates against
 * existing rows are resolved by the clause instead of failing the COPY.
 * Direct mode (use_temp_table=false) COPYs straight into the target.
 *
 * Not thread-safe; one instance per connection.
 */
class BulkCopy {
public:
    explicit BulkCopy(PostgresConnection& db, bool use_temp_table = true) noexcept;

    /// Aborts an unfinished COPY; unflushed rows are discarded.
    ~BulkCopy();

    BulkCopy(const BulkCopy&) = delete;
    BulkCopy& operator=(const BulkCopy&) = delete;

    void begin_table(const std::string& table_name, const std::vector<std::string>& columns);

    /// Missing or empty values become NULL.
    void add_row(const std::vector<std::string>& values);

    /**
     * @brief Finish the COPY and move rows into the target table.
     * @return Rows inserted into the target (after conflict resolution)
     */
    size_t flush();

    /// e.g. "ON CONFLICT (collection, edge_key, reverse) DO NOTHING"
    void set_conflict_clause(const std::string& clause);

    /// Number of rows added since begin_table (resets after flush)
    size_t count() const noexcept { return row_count_; }

private:
    void start_copy_if_needed();
    void escape_value_into_buffer(const std::string& value);
    std::string full_table_name() const;

    PostgresConnection& db_;
    std::ostringstream buffer_;

    std::string schema_;
    std::string table_name_;
    std::vector<std::string> columns_;
    std::string temp_table_name_;
    size_t row_count_ = 0;
    bool in_copy_ = false;
    bool use_temp_table_ = true;
    std::string conflict_clause_;

    static std::atomic<uint64_t> s_counter_;
    static constexpr size_t DEFAULT_FLUSH_ROWS = 50000;
};

/// Double-quote an SQL identifier.
std::string quote_identifier(const std::string& id);

} // namespace Coalesce
