#pragma once

#include <blocking/blocking_strategy.hpp>
#include <similarity/ann_adapter.hpp>
#include <memory>

namespace Coalesce {

/**
 * @brief Candidates from AnnAdapter::find_all_pairs.
 *
 * The adapter is probed at construction. If a call fails it is retried once
 * through a brute-force adapter; a second failure propagates.
 */
class VectorBlocking : public BlockingStrategy {
public:
    VectorBlocking(Store& store, BlockingSource source, VectorBlockingParams params);

    /// Method that produced the last candidate set.
    const std::string& last_method() const { return last_method_; }

    const AnnAdapter& adapter() const { return *adapter_; }

protected:
    void collect(CandidateSet& out) override;

private:
    AnnAdapterOptions adapter_options(bool force_brute_force) const;

    VectorBlockingParams params_;
    std::unique_ptr<AnnAdapter> adapter_;
    std::string last_method_;
};

} // namespace Coalesce
