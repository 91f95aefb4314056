/**
 * @file entities.hpp
 * @brief Value types that flow between the resolution stages
 *
 * CandidatePair is transient (one blocking call); MatchEdge, Cluster and
 * GoldenRecord are what the store persists.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <cmath>
#include <string>
#include <tuple>
#include <vector>

namespace Coalesce {

/**
 * @brief Unordered pair of record ids, stored canonically (first_id < second_id).
 */
struct CandidatePair {
    std::string first_id;
    std::string second_id;
    std::string strategy;
    std::string blocking_key;

    /**
     * @brief Build a canonical pair regardless of argument order.
     */
    static CandidatePair make(const std::string& a, const std::string& b,
                              std::string strategy, std::string blocking_key) {
        CandidatePair p;
        if (a < b) { p.first_id = a; p.second_id = b; }
        else       { p.first_id = b; p.second_id = a; }
        p.strategy = std::move(strategy);
        p.blocking_key = std::move(blocking_key);
        return p;
    }
};

inline bool operator<(const CandidatePair& a, const CandidatePair& b) {
    return std::tie(a.first_id, a.second_id) < std::tie(b.first_id, b.second_id);
}

inline bool operator==(const CandidatePair& a, const CandidatePair& b) {
    return a.first_id == b.first_id && a.second_id == b.second_id;
}

/**
 * @brief Scored pair on its way to becoming a MatchEdge.
 */
struct ScoredMatch {
    std::string first_id;
    std::string second_id;
    double similarity = 0.0;
    nlohmann::json attributes = nlohmann::json::object();
};

/**
 * @brief Persisted match edge.
 *
 * key is edge_key(from_id, to_id) and therefore identical for both
 * directions. The second edge of a bidirectional write has reverse=true;
 * stores treat (key, reverse) as the edge identity.
 */
struct MatchEdge {
    std::string key;
    std::string from_id;
    std::string to_id;
    double similarity = 0.0;    ///< rounded to 4 decimals
    std::string method;
    std::string timestamp;      ///< ISO-8601 UTC
    bool reverse = false;
    nlohmann::json attributes = nlohmann::json::object();
};

/**
 * @brief Connected component of the match graph.
 */
struct Cluster {
    std::string id;             ///< cluster_000000, position in canonical order
    std::string content_key;    ///< member_set_key(members)
    std::vector<std::string> members;   ///< sorted, unique
    std::string method;
    std::string timestamp;

    size_t size() const noexcept { return members.size(); }
};

struct GoldenRecord {
    std::string key;            ///< member_set_key(member_ids)
    std::string cluster_id;
    std::vector<std::string> member_ids;
    nlohmann::json fields = nlohmann::json::object();
    nlohmann::json provenance = nlohmann::json::object();  ///< field -> contributing record id
    std::string merge_policy;   ///< FieldMergePolicy::name() that produced `fields`
    std::string run_id;
    std::string method;
    std::string timestamp;
};

/**
 * @brief Round to a fixed number of decimals (half away from zero).
 */
inline double round_to(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

} // namespace Coalesce
