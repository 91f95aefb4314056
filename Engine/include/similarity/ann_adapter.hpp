/**
 * @file ann_adapter.hpp
 * @brief Vector similarity search with native-engine / brute-force selection
 *
 * The adapter probes the store's vector engine once at construction and
 * keeps the chosen executor for its lifetime. Every result carries the
 * method that actually produced it, so a native failure that fell back to
 * brute force is visible to the caller.
 */

#pragma once

#include <export.hpp>
#include <storage/store.hpp>
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Coalesce {

constexpr const char* METHOD_NATIVE_VECTOR_SEARCH = "native_vector_search";
constexpr const char* METHOD_BRUTE_FORCE = "brute_force";

struct VectorPair {
    std::string first_id;   ///< first_id < second_id
    std::string second_id;
    double similarity = 0.0;
    std::string method;
};

/**
 * @brief All-pairs search parameters.
 */
struct PairQuery {
    std::string collection;
    std::string embedding_field;
    double threshold = 0.7;
    size_t limit_per_entity = 20;
    std::optional<std::string> blocking_field;
    std::vector<RecordFilter> filters;
    size_t page_size = 1000;
};

/**
 * @brief Strategy interface: one way of executing a vector query.
 */
class VectorQueryExecutor {
public:
    virtual ~VectorQueryExecutor() = default;

    virtual const char* method() const = 0;
    virtual std::vector<VectorMatch> find_similar(const VectorQuery& query) = 0;
    virtual std::vector<VectorPair> find_all_pairs(const PairQuery& query) = 0;
};

/**
 * @brief Pushes queries down to Store::native_vector_search.
 */
class NativeVectorExecutor : public VectorQueryExecutor {
public:
    explicit NativeVectorExecutor(Store& store) : store_(store) {}

    const char* method() const override { return METHOD_NATIVE_VECTOR_SEARCH; }
    std::vector<VectorMatch> find_similar(const VectorQuery& query) override;
    std::vector<VectorPair> find_all_pairs(const PairQuery& query) override;

private:
    Store& store_;
};

/**
 * @brief In-process cosine scan over paged records (OpenMP over entities).
 */
class BruteForceVectorExecutor : public VectorQueryExecutor {
public:
    explicit BruteForceVectorExecutor(Store& store) : store_(store) {}

    const char* method() const override { return METHOD_BRUTE_FORCE; }
    std::vector<VectorMatch> find_similar(const VectorQuery& query) override;
    std::vector<VectorPair> find_all_pairs(const PairQuery& query) override;

    size_t page_size = 1000;

private:
    Store& store_;
};

struct AnnAdapterOptions {
    std::string collection;
    std::string embedding_field = "embedding_vector";
    bool force_brute_force = false;
    std::string min_native_version = "0.5.0";   ///< major.minor.patch
    size_t page_size = 1000;
};

/**
 * @brief find_similar_vectors parameters. Exactly one of query_vector /
 * query_id must be set.
 */
struct SimilarityQuery {
    std::optional<std::vector<double>> query_vector;
    std::optional<std::string> query_id;
    double threshold = 0.7;
    size_t limit = 10;
    bool exclude_self = true;
    std::optional<std::string> blocking_field;
    nlohmann::json blocking_value;
    std::vector<RecordFilter> filters;
};

class COALESCE_API AnnAdapter {
public:
    /**
     * @throws ValidationError for bad collection / field names
     * @throws ConfigurationError for an unparsable min_native_version
     */
    AnnAdapter(Store& store, AnnAdapterOptions options);

    /// Method chosen at construction ("native_vector_search" or "brute_force").
    const char* method() const { return executor_->method(); }

    bool uses_native() const { return native_; }

    const AnnAdapterOptions& options() const { return options_; }

    /**
     * @brief Ranked neighbours of a vector or of a stored record.
     *
     * Sorted by similarity descending (ties by id), capped at limit.
     * @throws ValidationError when neither or both query forms are given
     */
    std::vector<VectorMatch> find_similar_vectors(const SimilarityQuery& query);

    /**
     * @brief All pairs with similarity >= threshold, at most limit_per_entity
     * neighbours contributed by each entity, canonical and deduplicated.
     */
    std::vector<VectorPair> find_all_pairs(double threshold, size_t limit_per_entity,
                                           const std::optional<std::string>& blocking_field = std::nullopt,
                                           const std::vector<RecordFilter>& filters = {});

    /**
     * @brief Parse "major.minor.patch" out of an engine version string.
     */
    static std::optional<std::array<int, 3>> parse_version(const std::string& version);

private:
    bool probe_native();

    Store& store_;
    AnnAdapterOptions options_;
    std::array<int, 3> min_version_{};
    bool native_ = false;
    std::unique_ptr<VectorQueryExecutor> executor_;
    BruteForceVectorExecutor fallback_;
};

} // namespace Coalesce
