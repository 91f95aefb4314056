#pragma once

#include <blocking/blocking_strategy.hpp>

namespace Coalesce {

/**
 * @brief Block key = Soundex code of each configured name field, joined.
 */
class PhoneticBlocking : public BlockingStrategy {
public:
    PhoneticBlocking(Store& store, BlockingSource source, PhoneticBlockingParams params);

protected:
    void collect(CandidateSet& out) override;

private:
    PhoneticBlockingParams params_;
};

} // namespace Coalesce
