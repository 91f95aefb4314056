#pragma once

#include <blocking/blocking_strategy.hpp>

namespace Coalesce {

/**
 * @brief Records sharing at least one character n-gram (or the same
 * first-k-character prefix) of a normalized field collide.
 */
class NGramBlocking : public BlockingStrategy {
public:
    NGramBlocking(Store& store, BlockingSource source, NGramBlockingParams params);

    /// Blocking keys of a single value ("ng:abc" / "px:abcd").
    std::vector<std::string> keys_for(const std::string& value) const;

protected:
    void collect(CandidateSet& out) override;

private:
    NGramBlockingParams params_;
};

} // namespace Coalesce
