/**
 * @file merge_policy.hpp
 * @brief Field-merge policies that turn a cluster's records into one document
 */

#pragma once

#include <model/record.hpp>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

namespace Coalesce {

struct MergeResult {
    nlohmann::json fields = nlohmann::json::object();
    nlohmann::json provenance = nlohmann::json::object();  ///< field -> id of the record the value came from
};

class FieldMergePolicy {
public:
    virtual ~FieldMergePolicy() = default;

    virtual const char* name() const = 0;

    /**
     * @brief Merge member records (sorted by id) into one field map.
     */
    virtual MergeResult merge(const std::vector<Record>& members) const = 0;
};

/**
 * @brief Most frequent non-empty scalar value per field.
 *
 * Ties between strings go to the longest value, other ties to the first
 * record (by id) holding a tied value. Array and object values are never
 * merged.
 */
class MajorityMergePolicy : public FieldMergePolicy {
public:
    /**
     * @param fields Only merge these fields (all scalar fields when empty)
     * @param excluded Never merge these fields
     */
    explicit MajorityMergePolicy(std::vector<std::string> fields = {}, std::vector<std::string> excluded = {});

    const char* name() const override { return "majority"; }
    MergeResult merge(const std::vector<Record>& members) const override;

private:
    std::vector<std::string> fields_;
    std::set<std::string> excluded_;
};

} // namespace Coalesce
