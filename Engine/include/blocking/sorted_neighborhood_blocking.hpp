#pragma once

#include <blocking/blocking_strategy.hpp>

namespace Coalesce {

/**
 * @brief Sort records by a composite key and pair everything inside a
 * sliding window of window_size records.
 *
 * Only (id, key) tuples are kept in memory while sorting.
 */
class SortedNeighborhoodBlocking : public BlockingStrategy {
public:
    SortedNeighborhoodBlocking(Store& store, BlockingSource source, SortedNeighborhoodParams params);

protected:
    void collect(CandidateSet& out) override;

private:
    SortedNeighborhoodParams params_;
};

} // namespace Coalesce
