#include <database/bulk_copy.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>

namespace Coalesce {

std::atomic<uint64_t> BulkCopy::s_counter_{0};

std::string quote_identifier(const std::string& id) {
    std::string out;
    out.reserve(id.size() + 2);
    out.push_back('"');
    for (char c : id) {
        if (c == '"') out.append("\"\"");
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

BulkCopy::BulkCopy(PostgresConnection& db, bool use_temp_table) noexcept
    : db_(db), use_temp_table_(use_temp_table) {}

BulkCopy::~BulkCopy() {
    if (!in_copy_) return;
    try {
        db_.copy_end("bulk copy abandoned");
    } catch (const StorageError& e) {
        // The server reports the abort itself as a failed COPY
        Logger::debug(std::string("Abandoned COPY: ") + e.what());
    }
}

void BulkCopy::begin_table(const std::string& table_name, const std::vector<std::string>& columns) {
    if (in_copy_) throw StorageError("BulkCopy: previous table not flushed");

    auto dot_pos = table_name.find('.');
    if (dot_pos != std::string::npos) {
        schema_ = table_name.substr(0, dot_pos);
        table_name_ = table_name.substr(dot_pos + 1);
    } else {
        schema_.clear();
        table_name_ = table_name;
    }

    columns_ = columns;
    row_count_ = 0;
    buffer_.str("");
    buffer_.clear();

    if (use_temp_table_) {
        temp_table_name_ = "tmp_" + table_name_ + "_" + std::to_string(++s_counter_);
    } else {
        temp_table_name_.clear();
    }
}

std::string BulkCopy::full_table_name() const {
    if (schema_.empty()) {
        return quote_identifier(table_name_);
    }
    return quote_identifier(schema_) + "." + quote_identifier(table_name_);
}

void BulkCopy::escape_value_into_buffer(const std::string& value) {
    for (char c : value) {
        if (c == '\0') continue;
        switch (c) {
            case '\\': buffer_ << "\\\\"; break;
            case '\t': buffer_ << "\\t";  break;
            case '\n': buffer_ << "\\n";  break;
            case '\r': buffer_ << "\\r";  break;
            default:   buffer_ << c;      break;
        }
    }
}

void BulkCopy::start_copy_if_needed() {
    if (in_copy_) return;

    if (columns_.empty()) {
        throw StorageError("BulkCopy: columns not set. Call begin_table() first.");
    }

    std::string target_table = use_temp_table_ ? quote_identifier(temp_table_name_) : full_table_name();

    if (use_temp_table_) {
        db_.execute("CREATE TEMP TABLE IF NOT EXISTS " + target_table + " (LIKE " + full_table_name() +
                    " INCLUDING DEFAULTS) ON COMMIT PRESERVE ROWS");
        db_.execute("TRUNCATE " + target_table);
    }

    std::ostringstream copy_sql;
    copy_sql << "COPY " << target_table << " (";
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (i) copy_sql << ", ";
        copy_sql << quote_identifier(columns_[i]);
    }
    copy_sql << ") FROM STDIN";

    db_.execute(copy_sql.str());
    in_copy_ = true;
}

void BulkCopy::add_row(const std::vector<std::string>& values) {
    start_copy_if_needed();

    const size_t ncols = columns_.size();
    for (size_t i = 0; i < ncols; ++i) {
        if (i) buffer_ << '\t';
        if (i < values.size() && !values[i].empty()) {
            escape_value_into_buffer(values[i]);
        } else {
            buffer_ << "\\N";
        }
    }
    buffer_ << '\n';
    ++row_count_;

    if ((row_count_ % DEFAULT_FLUSH_ROWS) == 0) {
        std::string data = buffer_.str();
        db_.copy_data(data.c_str(), static_cast<int>(data.size()));
        buffer_.str("");
        buffer_.clear();
    }
}

size_t BulkCopy::flush() {
    if (!in_copy_) return 0;

    std::string data = buffer_.str();
    buffer_.str("");
    buffer_.clear();
    in_copy_ = false;

    if (!data.empty()) {
        db_.copy_data(data.c_str(), static_cast<int>(data.size()));
    }
    db_.copy_end(nullptr);

    size_t inserted = row_count_;
    if (use_temp_table_) {
        std::string cols;
        for (size_t i = 0; i < columns_.size(); ++i) {
            if (i) cols += ", ";
            cols += quote_identifier(columns_[i]);
        }

        std::string sql = "INSERT INTO " + full_table_name() + " (" + cols + ") SELECT " + cols +
                          " FROM " + quote_identifier(temp_table_name_);
        if (!conflict_clause_.empty()) sql += " " + conflict_clause_;

        inserted = db_.execute(sql);
        db_.execute("DROP TABLE IF EXISTS " + quote_identifier(temp_table_name_));
    }

    row_count_ = 0;
    return inserted;
}

void BulkCopy::set_conflict_clause(const std::string& clause) {
    conflict_clause_ = clause;
}

} // namespace Coalesce
