#pragma once

#include <blocking/blocking_strategy.hpp>

namespace Coalesce {

/**
 * @brief Groups records whose configured fields are all equal.
 *
 * Values are compared after normalize_text() unless case_sensitive, in which
 * case only surrounding whitespace is trimmed. Records missing any field are
 * skipped.
 */
class ExactBlocking : public BlockingStrategy {
public:
    ExactBlocking(Store& store, BlockingSource source, ExactBlockingParams params);

protected:
    void collect(CandidateSet& out) override;

private:
    ExactBlockingParams params_;
};

} // namespace Coalesce
