#include <blocking/blocking_strategy.hpp>
#include <utils/errors.hpp>
#include <utils/identifiers.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>

namespace Coalesce {

nlohmann::json BlockingStatistics::to_json() const {
    nlohmann::json j = {
        {"strategy", strategy},
        {"records_scanned", records_scanned},
        {"records_skipped", records_skipped},
        {"blocks_formed", blocks_formed},
        {"candidates_emitted", candidates_emitted},
        {"skipped_oversized_blocks", skipped_oversized_blocks},
        {"execution_time_ms", execution_time_ms}
    };
    for (const auto& [k, v] : details) j["details"][k] = v;
    return j;
}

// ============================================================================
// CandidateSet
// ============================================================================

bool CandidateSet::add(const std::string& a, const std::string& b, const std::string& blocking_key) {
    if (a == b) return false;
    auto key = (a < b) ? std::make_pair(a, b) : std::make_pair(b, a);
    if (pairs_.count(key)) return false;
    pairs_.emplace(key, CandidatePair::make(a, b, strategy_, blocking_key));
    return true;
}

bool CandidateSet::add(const CandidatePair& pair) {
    if (pair.first_id == pair.second_id) return false;
    auto canonical = CandidatePair::make(pair.first_id, pair.second_id, pair.strategy, pair.blocking_key);
    auto key = std::make_pair(canonical.first_id, canonical.second_id);
    return pairs_.emplace(key, std::move(canonical)).second;
}

std::vector<CandidatePair> CandidateSet::take() {
    std::vector<CandidatePair> out;
    out.reserve(pairs_.size());
    for (auto& [key, pair] : pairs_) out.push_back(std::move(pair));
    pairs_.clear();
    return out;
}

// ============================================================================
// BlockingStrategy
// ============================================================================

BlockingStrategy::BlockingStrategy(Store& store, std::string name, BlockingSource source)
    : store_(store), name_(std::move(name)), source_(std::move(source)) {
    validate_identifier(source_.collection, "collection");
    validate_filters(source_.filters);

    if (source_.page_size == 0) {
        throw ConfigurationError(name_ + ": page_size must be positive");
    }
    if (source_.min_block_size < 2) {
        throw ConfigurationError(name_ + ": min_block_size must be at least 2");
    }
    if (source_.max_block_size < source_.min_block_size) {
        throw ConfigurationError(name_ + ": max_block_size must be >= min_block_size");
    }
    stats_.strategy = name_;
}

std::vector<CandidatePair> BlockingStrategy::generate_candidates() {
    Timer timer;
    stats_ = BlockingStatistics{};
    stats_.strategy = name_;

    CandidateSet set(name_);
    collect(set);

    stats_.candidates_emitted = set.size();
    stats_.execution_time_ms = timer.elapsed_ms();

    Logger::info(name_ + " blocking on " + source_.collection + ": " +
                 std::to_string(stats_.candidates_emitted) + " candidates from " +
                 std::to_string(stats_.blocks_formed) + " blocks (" +
                 std::to_string(stats_.skipped_oversized_blocks) + " oversized skipped)");
    return set.take();
}

void BlockingStrategy::for_each_record(const std::function<void(const Record&)>& fn) {
    for (size_t offset = 0;; offset += source_.page_size) {
        auto page = store_.fetch_records(source_.collection, source_.filters, offset, source_.page_size);
        for (const auto& record : page) {
            ++stats_.records_scanned;
            fn(record);
        }
        if (page.size() < source_.page_size) break;
    }
}

void BlockingStrategy::emit_blocks(const std::map<std::string, std::vector<std::string>>& blocks,
                                   CandidateSet& out) {
    emit_blocks(blocks, out, source_.max_block_size);
}

void BlockingStrategy::emit_blocks(const std::map<std::string, std::vector<std::string>>& blocks,
                                   CandidateSet& out, size_t max_block_size) {
    for (const auto& [key, ids] : blocks) {
        if (ids.size() < source_.min_block_size) continue;
        if (max_block_size > 0 && ids.size() > max_block_size) {
            ++stats_.skipped_oversized_blocks;
            Logger::debug(name_ + ": skipping block '" + key + "' of size " + std::to_string(ids.size()));
            continue;
        }

        ++stats_.blocks_formed;
        for (size_t i = 0; i < ids.size(); ++i) {
            for (size_t j = i + 1; j < ids.size(); ++j) {
                out.add(ids[i], ids[j], key);
            }
        }
    }
}

} // namespace Coalesce
