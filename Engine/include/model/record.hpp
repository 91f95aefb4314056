/**
 * @file record.hpp
 * @brief Record: identifier plus an open map of named field values
 */

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Coalesce {

/**
 * @brief A single source record as read from the store.
 *
 * Field values are strings, numbers or arrays of numbers (pre-computed
 * vectors). The engine never mutates a record in place; enrichment goes
 * back to the store through Store::update_records.
 */
struct Record {
    std::string id;
    nlohmann::json fields = nlohmann::json::object();

    Record() = default;
    Record(std::string record_id, nlohmann::json record_fields);

    /**
     * @brief True if the field exists and is not null or a blank string.
     */
    bool has(const std::string& field) const;

    /**
     * @brief Text view of a scalar field. Numbers and booleans are stringified.
     * @return nullopt for missing, null, blank, array or object values
     */
    std::optional<std::string> text(const std::string& field) const;

    /**
     * @brief Numeric vector stored in a field (JSON array of numbers).
     * @return nullopt if missing, empty or not purely numeric
     */
    std::optional<std::vector<double>> vector(const std::string& field) const;

    std::optional<double> number(const std::string& field) const;
};

} // namespace Coalesce
