#pragma once

#include <Eigen/Core>
#include <vector>

namespace Coalesce {

/// Vectors with a smaller L2 norm are treated as zero.
constexpr double MIN_VECTOR_MAGNITUDE = 1e-10;

inline Eigen::Map<const Eigen::VectorXd> as_eigen(const std::vector<double>& v) {
    return Eigen::Map<const Eigen::VectorXd>(v.data(), static_cast<Eigen::Index>(v.size()));
}

/**
 * @brief Cosine similarity; 0 when either vector is (near) zero or sizes differ.
 */
double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b);

/**
 * @brief Unit-length copy of @p v; a (near) zero vector is returned unchanged.
 */
Eigen::VectorXd unit_vector(const std::vector<double>& v);

} // namespace Coalesce
