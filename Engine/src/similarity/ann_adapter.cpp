/**
 * @file ann_adapter.cpp
 * @brief Capability-probed vector search: native engine or brute-force scan
 */

#include <similarity/ann_adapter.hpp>
#include <similarity/vector_math.hpp>
#include <utils/errors.hpp>
#include <utils/identifiers.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <map>
#include <regex>

namespace Coalesce {

static bool same_block(const Record& record, const std::optional<std::string>& field, const nlohmann::json& value) {
    if (!field) return true;
    return record.has(*field) && record.fields.at(*field) == value;
}

static void sort_matches(std::vector<VectorMatch>& matches, size_t limit) {
    std::sort(matches.begin(), matches.end(), [](const VectorMatch& a, const VectorMatch& b) {
        if (a.similarity != b.similarity) return a.similarity > b.similarity;
        return a.id < b.id;
    });
    if (matches.size() > limit) matches.resize(limit);
}

// ============================================================================
// NativeVectorExecutor
// ============================================================================

std::vector<VectorMatch> NativeVectorExecutor::find_similar(const VectorQuery& query) {
    auto matches = store_.native_vector_search(query);
    for (auto& m : matches) m.method = method();
    sort_matches(matches, query.limit);
    return matches;
}

std::vector<VectorPair> NativeVectorExecutor::find_all_pairs(const PairQuery& query) {
    std::map<std::pair<std::string, std::string>, double> pairs;

    for (size_t offset = 0;; offset += query.page_size) {
        auto page = store_.fetch_records(query.collection, query.filters, offset, query.page_size);

        for (const auto& record : page) {
            auto v = record.vector(query.embedding_field);
            if (!v) continue;
            if (query.blocking_field && !record.has(*query.blocking_field)) continue;

            VectorQuery vq;
            vq.collection = query.collection;
            vq.embedding_field = query.embedding_field;
            vq.vector = std::move(*v);
            vq.threshold = query.threshold;
            vq.limit = query.limit_per_entity;
            vq.exclude_id = record.id;
            vq.filters = query.filters;
            if (query.blocking_field) {
                vq.blocking_field = query.blocking_field;
                vq.blocking_value = record.fields.at(*query.blocking_field);
            }

            for (const auto& m : store_.native_vector_search(vq)) {
                if (m.id == record.id) continue;
                auto key = (record.id < m.id) ? std::make_pair(record.id, m.id) : std::make_pair(m.id, record.id);
                pairs.emplace(key, m.similarity);
            }
        }

        if (page.size() < query.page_size) break;
    }

    std::vector<VectorPair> out;
    out.reserve(pairs.size());
    for (const auto& [key, sim] : pairs) {
        out.push_back({key.first, key.second, sim, method()});
    }
    return out;
}

// ============================================================================
// BruteForceVectorExecutor
// ============================================================================

std::vector<VectorMatch> BruteForceVectorExecutor::find_similar(const VectorQuery& query) {
    std::vector<VectorMatch> matches;

    for (size_t offset = 0;; offset += page_size) {
        auto page = store_.fetch_records(query.collection, query.filters, offset, page_size);

        for (const auto& record : page) {
            if (query.exclude_id && record.id == *query.exclude_id) continue;
            if (!same_block(record, query.blocking_field, query.blocking_value)) continue;

            auto v = record.vector(query.embedding_field);
            if (!v) continue;
            double sim = cosine_similarity(query.vector, *v);
            if (sim >= query.threshold) {
                matches.push_back({record.id, sim, method()});
            }
        }

        if (page.size() < page_size) break;
    }

    sort_matches(matches, query.limit);
    return matches;
}

std::vector<VectorPair> BruteForceVectorExecutor::find_all_pairs(const PairQuery& query) {
    struct Entry {
        std::string id;
        Eigen::VectorXd unit;
        bool zero = false;
        nlohmann::json block;
    };

    // Pages come back ordered by id, so entry index order is id order
    std::vector<Entry> entries;
    Eigen::Index dim = -1;
    size_t dim_mismatches = 0;

    for (size_t offset = 0;; offset += page_size) {
        auto page = store_.fetch_records(query.collection, query.filters, offset, page_size);

        for (const auto& record : page) {
            auto v = record.vector(query.embedding_field);
            if (!v) continue;
            if (query.blocking_field && !record.has(*query.blocking_field)) continue;

            if (dim < 0) dim = static_cast<Eigen::Index>(v->size());
            if (static_cast<Eigen::Index>(v->size()) != dim) {
                ++dim_mismatches;
                continue;
            }

            Entry e;
            e.id = record.id;
            e.zero = as_eigen(*v).norm() < MIN_VECTOR_MAGNITUDE;
            e.unit = unit_vector(*v);
            if (query.blocking_field) e.block = record.fields.at(*query.blocking_field);
            entries.push_back(std::move(e));
        }

        if (page.size() < page_size) break;
    }

    if (dim_mismatches > 0) {
        Logger::warn("Brute-force scan skipped " + std::to_string(dim_mismatches) +
                     " vectors with dimension != " + std::to_string(dim));
    }

    const long n = static_cast<long>(entries.size());
    std::vector<std::vector<std::pair<double, long>>> neighbours(entries.size());

    #pragma omp parallel for schedule(dynamic, 16)
    for (long i = 0; i < n; ++i) {
        const Entry& a = entries[i];
        if (a.zero) continue;
        auto& mine = neighbours[i];

        for (long j = 0; j < n; ++j) {
            if (j == i) continue;
            const Entry& b = entries[j];
            if (b.zero) continue;
            if (query.blocking_field && a.block != b.block) continue;

            double sim = a.unit.dot(b.unit);
            if (sim >= query.threshold) mine.emplace_back(sim, j);
        }

        std::sort(mine.begin(), mine.end(), [](const auto& x, const auto& y) {
            if (x.first != y.first) return x.first > y.first;
            return x.second < y.second;
        });
        if (mine.size() > query.limit_per_entity) mine.resize(query.limit_per_entity);
    }

    std::map<std::pair<long, long>, double> pairs;
    for (long i = 0; i < n; ++i) {
        for (const auto& [sim, j] : neighbours[i]) {
            pairs.emplace(std::make_pair(std::min(i, j), std::max(i, j)), sim);
        }
    }

    std::vector<VectorPair> out;
    out.reserve(pairs.size());
    for (const auto& [key, sim] : pairs) {
        out.push_back({entries[key.first].id, entries[key.second].id, sim, method()});
    }
    return out;
}

// ============================================================================
// AnnAdapter
// ============================================================================

AnnAdapter::AnnAdapter(Store& store, AnnAdapterOptions options)
    : store_(store), options_(std::move(options)), fallback_(store) {
    validate_identifier(options_.collection, "collection");
    validate_identifier(options_.embedding_field, "embedding field");
    if (options_.page_size == 0) {
        throw ConfigurationError("ANN adapter page_size must be positive");
    }

    auto min_version = parse_version(options_.min_native_version);
    if (!min_version) {
        throw ConfigurationError("min_native_version '" + options_.min_native_version + "' is not major.minor.patch");
    }
    min_version_ = *min_version;
    fallback_.page_size = options_.page_size;

    native_ = !options_.force_brute_force && probe_native();
    if (native_) {
        executor_ = std::make_unique<NativeVectorExecutor>(store_);
    } else {
        auto brute = std::make_unique<BruteForceVectorExecutor>(store_);
        brute->page_size = options_.page_size;
        executor_ = std::move(brute);
    }

    Logger::info("ANN adapter for " + options_.collection + "." + options_.embedding_field +
                 " using " + executor_->method());
}

std::optional<std::array<int, 3>> AnnAdapter::parse_version(const std::string& version) {
    static const std::regex pattern(R"((\d+)\.(\d+)\.(\d+))");
    std::smatch m;
    if (!std::regex_search(version, m, pattern)) return std::nullopt;
    try {
        return std::array<int, 3>{std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str())};
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

bool AnnAdapter::probe_native() {
    VectorEngineInfo engine;
    try {
        engine = store_.vector_engine();
    } catch (const std::exception& e) {
        Logger::warn(std::string("Vector engine probe failed, using brute force: ") + e.what());
        return false;
    }

    if (engine.version.empty()) return false;

    auto version = parse_version(engine.version);
    if (!version) {
        Logger::warn("Unrecognised vector engine version '" + engine.version + "', using brute force");
        return false;
    }
    return *version >= min_version_;
}

std::vector<VectorMatch> AnnAdapter::find_similar_vectors(const SimilarityQuery& query) {
    if (query.query_vector.has_value() == query.query_id.has_value()) {
        throw ValidationError("exactly one of query_vector or query_id must be supplied");
    }
    if (query.threshold < 0.0 || query.threshold > 1.0) {
        throw ValidationError("similarity threshold must be in [0, 1]");
    }
    if (query.limit == 0) {
        throw ValidationError("limit must be positive");
    }
    if (query.blocking_field) validate_identifier(*query.blocking_field, "blocking field");

    VectorQuery vq;
    vq.collection = options_.collection;
    vq.embedding_field = options_.embedding_field;
    vq.threshold = query.threshold;
    vq.limit = query.limit;
    vq.blocking_field = query.blocking_field;
    vq.blocking_value = query.blocking_value;
    vq.filters = query.filters;

    if (query.query_id) {
        auto v = store_.fetch_vector(options_.collection, *query.query_id, options_.embedding_field);
        if (!v) {
            Logger::warn("Record " + *query.query_id + " has no " + options_.embedding_field);
            return {};
        }
        vq.vector = std::move(*v);
        if (query.exclude_self) vq.exclude_id = *query.query_id;
    } else {
        vq.vector = *query.query_vector;
    }

    if (vq.vector.empty()) {
        throw ValidationError("query vector is empty");
    }

    if (native_) {
        try {
            return executor_->find_similar(vq);
        } catch (const std::exception& e) {
            Logger::warn(std::string("Native vector search failed, retrying with brute force: ") + e.what());
        }
        return fallback_.find_similar(vq);
    }
    return executor_->find_similar(vq);
}

std::vector<VectorPair> AnnAdapter::find_all_pairs(double threshold, size_t limit_per_entity,
                                                   const std::optional<std::string>& blocking_field,
                                                   const std::vector<RecordFilter>& filters) {
    if (threshold < 0.0 || threshold > 1.0) {
        throw ValidationError("similarity threshold must be in [0, 1]");
    }
    if (limit_per_entity == 0) {
        throw ValidationError("limit_per_entity must be positive");
    }
    if (blocking_field) validate_identifier(*blocking_field, "blocking field");

    PairQuery pq;
    pq.collection = options_.collection;
    pq.embedding_field = options_.embedding_field;
    pq.threshold = threshold;
    pq.limit_per_entity = limit_per_entity;
    pq.blocking_field = blocking_field;
    pq.filters = filters;
    pq.page_size = options_.page_size;

    if (native_) {
        try {
            return executor_->find_all_pairs(pq);
        } catch (const std::exception& e) {
            Logger::warn(std::string("Native all-pairs search failed, retrying with brute force: ") + e.what());
        }
        return fallback_.find_all_pairs(pq);
    }
    return executor_->find_all_pairs(pq);
}

} // namespace Coalesce
