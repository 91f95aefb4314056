/**
 * @file record_filter.hpp
 * @brief Scalar pre-filters applied before blocking or vector search
 */

#pragma once

#include <model/record.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Coalesce {

struct RecordFilter {
    enum class Op {
        NotNull,    ///< field present and non-blank
        Equals,     ///< field == value
        NotEquals,  ///< field missing or != value
        In,         ///< field is one of value[] (JSON array)
        Range,      ///< min_value <= field <= max_value (numeric)
        MinLength   ///< text length >= min_length
    };

    std::string field;
    Op op = Op::NotNull;
    nlohmann::json value;
    std::optional<double> min_value;
    std::optional<double> max_value;
    size_t min_length = 0;

    static RecordFilter not_null(std::string field);
    static RecordFilter equals(std::string field, nlohmann::json value);
    static RecordFilter not_equals(std::string field, nlohmann::json value);
    static RecordFilter in(std::string field, nlohmann::json values);
    static RecordFilter range(std::string field, std::optional<double> min_value, std::optional<double> max_value);
    static RecordFilter longer_than(std::string field, size_t min_length);

    bool matches(const Record& record) const;

    /**
     * @brief Parse {"field": ..., "op": "equals", "value": ...}.
     *
     * Range filters take "min" and/or "max", min_length takes "length".
     * Throws ConfigurationError on unknown operators or malformed values.
     */
    static RecordFilter from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;
};

const char* to_string(RecordFilter::Op op);

bool matches_all(const std::vector<RecordFilter>& filters, const Record& record);

/**
 * @brief Reject filters that can never be evaluated (bad field names, In without
 * an array, Range without bounds, inverted range).
 */
void validate_filters(const std::vector<RecordFilter>& filters);

} // namespace Coalesce
