#include <blocking/composite_blocking.hpp>
#include <utils/errors.hpp>

namespace Coalesce {

static BlockingSource first_source(const std::vector<BlockingSpec>& specs) {
    if (specs.empty()) {
        throw ConfigurationError("composite blocking requires at least one strategy");
    }
    return specs.front().source;
}

CompositeBlocking::CompositeBlocking(Store& store, const std::vector<BlockingSpec>& specs)
    : BlockingStrategy(store, "composite", first_source(specs)) {
    for (const auto& spec : specs) {
        children_.push_back(make_blocking_strategy(store, spec));
    }
}

void CompositeBlocking::collect(CandidateSet& out) {
    child_stats_.clear();

    for (auto& child : children_) {
        for (const auto& pair : child->generate_candidates()) {
            out.add(pair);
        }
        const auto& cs = child->get_statistics();
        stats_.records_scanned += cs.records_scanned;
        stats_.records_skipped += cs.records_skipped;
        stats_.blocks_formed += cs.blocks_formed;
        stats_.skipped_oversized_blocks += cs.skipped_oversized_blocks;
        stats_.details[cs.strategy + "_candidates"] = std::to_string(cs.candidates_emitted);
        child_stats_.push_back(cs);
    }
}

} // namespace Coalesce
