#pragma once

#include <blocking/blocking_spec.hpp>
#include <blocking/blocking_strategy.hpp>
#include <memory>
#include <vector>

namespace Coalesce {

/**
 * @brief Union of several strategies over the same collection.
 *
 * A pair emitted by more than one child keeps the strategy and blocking key
 * of the first child (in configuration order) that produced it.
 */
class CompositeBlocking : public BlockingStrategy {
public:
    CompositeBlocking(Store& store, const std::vector<BlockingSpec>& specs);

    const std::vector<BlockingStatistics>& child_statistics() const { return child_stats_; }

protected:
    void collect(CandidateSet& out) override;

private:
    std::vector<std::unique_ptr<BlockingStrategy>> children_;
    std::vector<BlockingStatistics> child_stats_;
};

} // namespace Coalesce
