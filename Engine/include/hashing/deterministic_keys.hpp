/**
 * @file deterministic_keys.hpp
 * @brief Content-derived keys for edges, clusters and golden records
 */

#pragma once

#include <string>
#include <vector>

namespace Coalesce {

/**
 * @brief Key of the undirected edge {a, b}.
 *
 * Endpoints are sorted before hashing, so edge_key(a, b) == edge_key(b, a).
 */
std::string edge_key(const std::string& a, const std::string& b);

/**
 * @brief Key of a directed link from -> to (e.g. member resolved to golden record).
 */
std::string directed_edge_key(const std::string& from, const std::string& to);

/**
 * @brief Key of a member set. Order and duplicates in @p members do not matter.
 */
std::string member_set_key(std::vector<std::string> members);

} // namespace Coalesce
