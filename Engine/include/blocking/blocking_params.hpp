/**
 * @file blocking_params.hpp
 * @brief Typed parameters for each blocking strategy
 */

#pragma once

#include <model/record_filter.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Coalesce {

/**
 * @brief Where a strategy reads records from, plus the admission limits
 * shared by every block-based strategy.
 */
struct BlockingSource {
    std::string collection;
    std::vector<RecordFilter> filters;  ///< scalar pre-filters, all must match
    size_t page_size = 1000;
    size_t min_block_size = 2;          ///< smaller blocks emit nothing
    size_t max_block_size = 100;        ///< larger blocks are skipped entirely
};

struct ExactBlockingParams {
    std::vector<std::string> fields;
    bool case_sensitive = false;
};

struct NGramBlockingParams {
    std::string field;
    size_t n = 3;
    size_t prefix_length = 0;           ///< > 0: block on the first k chars instead of n-grams
};

struct PhoneticBlockingParams {
    std::vector<std::string> fields;
};

struct SortedNeighborhoodParams {
    std::vector<std::string> key_fields;
    size_t window_size = 5;
};

struct LshBlockingParams {
    std::string embedding_field = "embedding_vector";
    size_t num_hash_tables = 10;        ///< L
    size_t num_hyperplanes = 8;         ///< k, 1..64
    uint64_t seed = 42;
    std::optional<std::string> blocking_field;
    size_t max_bucket_size = 0;         ///< 0 = uncapped; BlockingSource::max_block_size does not apply
};

struct VectorBlockingParams {
    std::string embedding_field = "embedding_vector";
    double similarity_threshold = 0.7;
    size_t limit_per_entity = 20;
    std::optional<std::string> blocking_field;
    bool force_brute_force = false;
    std::string min_native_version = "0.5.0";
};

} // namespace Coalesce
