/**
 * @file blocking_strategy.hpp
 * @brief Common contract for candidate-pair generators
 */

#pragma once

#include <blocking/blocking_params.hpp>
#include <model/entities.hpp>
#include <storage/store.hpp>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Coalesce {

struct BlockingStatistics {
    std::string strategy;
    size_t records_scanned = 0;
    size_t records_skipped = 0;         ///< missing blocking fields / vectors
    size_t blocks_formed = 0;
    size_t candidates_emitted = 0;
    size_t skipped_oversized_blocks = 0;
    double execution_time_ms = 0.0;
    std::map<std::string, std::string> details;

    nlohmann::json to_json() const;
};

/**
 * @brief Deduplicating accumulator of canonical candidate pairs.
 *
 * The first (strategy, blocking key) recorded for a pair is kept.
 */
class CandidateSet {
public:
    explicit CandidateSet(std::string strategy) : strategy_(std::move(strategy)) {}

    /// @return false for self pairs and pairs already present
    bool add(const std::string& a, const std::string& b, const std::string& blocking_key);
    bool add(const CandidatePair& pair);

    size_t size() const noexcept { return pairs_.size(); }

    /// Sorted by (first_id, second_id). Leaves the set empty.
    std::vector<CandidatePair> take();

private:
    std::string strategy_;
    std::map<std::pair<std::string, std::string>, CandidatePair> pairs_;
};

class BlockingStrategy {
public:
    /**
     * @throws ValidationError for a bad collection or filter field name
     * @throws ConfigurationError for invalid paging / block limits / filters
     */
    BlockingStrategy(Store& store, std::string name, BlockingSource source);
    virtual ~BlockingStrategy() = default;

    BlockingStrategy(const BlockingStrategy&) = delete;
    BlockingStrategy& operator=(const BlockingStrategy&) = delete;

    /**
     * @brief Run the strategy over the collection.
     * @return Deduplicated canonical pairs sorted by (first_id, second_id)
     */
    std::vector<CandidatePair> generate_candidates();

    /// Statistics of the most recent generate_candidates() call.
    const BlockingStatistics& get_statistics() const { return stats_; }

    const std::string& name() const { return name_; }

protected:
    virtual void collect(CandidateSet& out) = 0;

    /// Page through the source collection, applying the scalar pre-filters.
    void for_each_record(const std::function<void(const Record&)>& fn);

    /// Emit every intra-block pair, honouring min/max block size.
    void emit_blocks(const std::map<std::string, std::vector<std::string>>& blocks, CandidateSet& out);

    /// Same, with an explicit upper bound (0 = no upper bound).
    void emit_blocks(const std::map<std::string, std::vector<std::string>>& blocks, CandidateSet& out,
                     size_t max_block_size);

    Store& store_;
    std::string name_;
    BlockingSource source_;
    BlockingStatistics stats_;
};

} // namespace Coalesce
