/**
 * @file lsh_blocking.hpp
 * @brief Random-hyperplane locality-sensitive hashing over record embeddings
 */

#pragma once

#include <blocking/blocking_strategy.hpp>
#include <Eigen/Core>
#include <cstdint>
#include <vector>

namespace Coalesce {

/**
 * @brief L hash tables of k random hyperplanes each.
 *
 * A record's signature in table t is the k-bit mask of signs of its
 * (normalized) embedding against the table's hyperplanes. Records sharing a
 * signature in any table become candidates. Hyperplanes are drawn from
 * std::mt19937_64(seed), so identical records, seed and (L, k) give an
 * identical candidate set.
 */
class LshBlocking : public BlockingStrategy {
public:
    LshBlocking(Store& store, BlockingSource source, LshBlockingParams params);

    /**
     * @brief Draw hyperplanes for the given dimension (idempotent per dimension).
     */
    void prepare(Eigen::Index dimension);

    /// One signature per table. prepare() must have been called.
    std::vector<uint64_t> signatures(const Eigen::VectorXd& vector) const;

    Eigen::Index dimension() const { return dimension_; }

protected:
    void collect(CandidateSet& out) override;

private:
    LshBlockingParams params_;
    Eigen::Index dimension_ = 0;
    std::vector<Eigen::MatrixXd> hyperplanes_;  ///< L matrices of k x dimension, unit rows
};

} // namespace Coalesce
