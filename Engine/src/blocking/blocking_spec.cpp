#include <blocking/blocking_spec.hpp>
#include <blocking/exact_blocking.hpp>
#include <blocking/lsh_blocking.hpp>
#include <blocking/ngram_blocking.hpp>
#include <blocking/phonetic_blocking.hpp>
#include <blocking/sorted_neighborhood_blocking.hpp>
#include <blocking/vector_blocking.hpp>
#include <utils/errors.hpp>
#include <cstdint>
#include <set>
#include <type_traits>

namespace Coalesce {

const char* to_string(BlockingKind kind) {
    switch (kind) {
        case BlockingKind::Exact:              return "exact";
        case BlockingKind::NGram:              return "ngram";
        case BlockingKind::Phonetic:           return "phonetic";
        case BlockingKind::SortedNeighborhood: return "sorted_neighborhood";
        case BlockingKind::Lsh:                return "lsh";
        case BlockingKind::Vector:             return "vector";
    }
    return "unknown";
}

namespace {

struct StrategyBuilder {
    Store& store;
    const BlockingSource& source;

    std::unique_ptr<BlockingStrategy> operator()(const ExactBlockingParams& p) const {
        return std::make_unique<ExactBlocking>(store, source, p);
    }
    std::unique_ptr<BlockingStrategy> operator()(const NGramBlockingParams& p) const {
        return std::make_unique<NGramBlocking>(store, source, p);
    }
    std::unique_ptr<BlockingStrategy> operator()(const PhoneticBlockingParams& p) const {
        return std::make_unique<PhoneticBlocking>(store, source, p);
    }
    std::unique_ptr<BlockingStrategy> operator()(const SortedNeighborhoodParams& p) const {
        return std::make_unique<SortedNeighborhoodBlocking>(store, source, p);
    }
    std::unique_ptr<BlockingStrategy> operator()(const LshBlockingParams& p) const {
        return std::make_unique<LshBlocking>(store, source, p);
    }
    std::unique_ptr<BlockingStrategy> operator()(const VectorBlockingParams& p) const {
        return std::make_unique<VectorBlocking>(store, source, p);
    }
};

std::vector<std::string> string_list(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key)) return out;
    const auto& v = j.at(key);
    if (v.is_string()) {
        out.push_back(v.get<std::string>());
        return out;
    }
    if (!v.is_array()) throw ConfigurationError(std::string("'") + key + "' must be a string or array");
    for (const auto& s : v) {
        if (!s.is_string()) throw ConfigurationError(std::string("'") + key + "' must contain strings");
        out.push_back(s.get<std::string>());
    }
    return out;
}

/// Non-negative integer option; the JSON type is checked before it can wrap.
template <typename T>
T count_value(const nlohmann::json& j, const char* key, T fallback) {
    if (!j.contains(key)) return fallback;
    const auto& v = j.at(key);
    if (!v.is_number_integer()) {
        throw ConfigurationError(std::string("'") + key + "' must be an integer");
    }
    if (!v.is_number_unsigned() && v.get<int64_t>() < 0) {
        throw ConfigurationError(std::string("'") + key + "' must not be negative");
    }
    return v.get<T>();
}

void reject_unknown_keys(const nlohmann::json& j, const std::set<std::string>& allowed, const std::string& type) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!allowed.count(it.key())) {
            throw ConfigurationError("unknown key '" + it.key() + "' for " + type + " blocking");
        }
    }
}

} // namespace

std::unique_ptr<BlockingStrategy> make_blocking_strategy(Store& store, const BlockingSpec& spec) {
    return std::visit(StrategyBuilder{store, spec.source}, spec.params);
}

BlockingSpec blocking_spec_from_json(const nlohmann::json& j, const std::string& collection) {
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        throw ConfigurationError("blocking strategy requires a string 'type'");
    }
    const std::string type = j["type"].get<std::string>();

    std::set<std::string> allowed = {"type", "collection", "filters", "page_size", "min_block_size", "max_block_size"};

    BlockingSpec spec;
    try {
        spec.source.collection = j.value("collection", collection);
        spec.source.page_size = count_value(j, "page_size", spec.source.page_size);
        spec.source.min_block_size = count_value(j, "min_block_size", spec.source.min_block_size);
        spec.source.max_block_size = count_value(j, "max_block_size", spec.source.max_block_size);
        if (j.contains("filters")) {
            for (const auto& f : j["filters"]) spec.source.filters.push_back(RecordFilter::from_json(f));
        }

        if (type == "exact") {
            allowed.insert({"fields", "case_sensitive"});
            ExactBlockingParams p;
            p.fields = string_list(j, "fields");
            p.case_sensitive = j.value("case_sensitive", p.case_sensitive);
            spec.params = p;
        } else if (type == "ngram") {
            allowed.insert({"field", "n", "prefix_length"});
            NGramBlockingParams p;
            p.field = j.value("field", std::string());
            p.n = count_value(j, "n", p.n);
            p.prefix_length = count_value(j, "prefix_length", p.prefix_length);
            spec.params = p;
        } else if (type == "phonetic") {
            allowed.insert({"fields"});
            PhoneticBlockingParams p;
            p.fields = string_list(j, "fields");
            spec.params = p;
        } else if (type == "sorted_neighborhood") {
            allowed.insert({"key_fields", "window_size"});
            SortedNeighborhoodParams p;
            p.key_fields = string_list(j, "key_fields");
            p.window_size = count_value(j, "window_size", p.window_size);
            spec.params = p;
        } else if (type == "lsh") {
            allowed.insert({"embedding_field", "num_hash_tables", "num_hyperplanes", "seed", "blocking_field",
                        "max_bucket_size"});
            LshBlockingParams p;
            p.embedding_field = j.value("embedding_field", p.embedding_field);
            p.num_hash_tables = count_value(j, "num_hash_tables", p.num_hash_tables);
            p.num_hyperplanes = count_value(j, "num_hyperplanes", p.num_hyperplanes);
            p.seed = count_value(j, "seed", p.seed);
            p.max_bucket_size = count_value(j, "max_bucket_size", p.max_bucket_size);
            if (j.contains("blocking_field") && !j["blocking_field"].is_null()) {
                p.blocking_field = j["blocking_field"].get<std::string>();
            }
            spec.params = p;
        } else if (type == "vector") {
            allowed.insert({"embedding_field", "similarity_threshold", "limit_per_entity", "blocking_field",
                            "force_brute_force", "min_native_version"});
            VectorBlockingParams p;
            p.embedding_field = j.value("embedding_field", p.embedding_field);
            p.similarity_threshold = j.value("similarity_threshold", p.similarity_threshold);
            p.limit_per_entity = count_value(j, "limit_per_entity", p.limit_per_entity);
            p.force_brute_force = j.value("force_brute_force", p.force_brute_force);
            p.min_native_version = j.value("min_native_version", p.min_native_version);
            if (j.contains("blocking_field") && !j["blocking_field"].is_null()) {
                p.blocking_field = j["blocking_field"].get<std::string>();
            }
            spec.params = p;
        } else {
            throw ConfigurationError("unknown blocking strategy '" + type + "'");
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(type + " blocking: " + e.what());
    }

    reject_unknown_keys(j, allowed, type);
    return spec;
}

nlohmann::json blocking_spec_to_json(const BlockingSpec& spec) {
    nlohmann::json j = {
        {"type", to_string(spec.kind())},
        {"collection", spec.source.collection},
        {"page_size", spec.source.page_size},
        {"min_block_size", spec.source.min_block_size},
        {"max_block_size", spec.source.max_block_size}
    };
    if (!spec.source.filters.empty()) {
        nlohmann::json filters = nlohmann::json::array();
        for (const auto& f : spec.source.filters) filters.push_back(f.to_json());
        j["filters"] = filters;
    }

    std::visit([&](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ExactBlockingParams>) {
            j["fields"] = p.fields;
            j["case_sensitive"] = p.case_sensitive;
        } else if constexpr (std::is_same_v<T, NGramBlockingParams>) {
            j["field"] = p.field;
            j["n"] = p.n;
            j["prefix_length"] = p.prefix_length;
        } else if constexpr (std::is_same_v<T, PhoneticBlockingParams>) {
            j["fields"] = p.fields;
        } else if constexpr (std::is_same_v<T, SortedNeighborhoodParams>) {
            j["key_fields"] = p.key_fields;
            j["window_size"] = p.window_size;
        } else if constexpr (std::is_same_v<T, LshBlockingParams>) {
            j["embedding_field"] = p.embedding_field;
            j["num_hash_tables"] = p.num_hash_tables;
            j["num_hyperplanes"] = p.num_hyperplanes;
            j["seed"] = p.seed;
            if (p.blocking_field) j["blocking_field"] = *p.blocking_field;
            j["max_bucket_size"] = p.max_bucket_size;
        } else {
            j["embedding_field"] = p.embedding_field;
            j["similarity_threshold"] = p.similarity_threshold;
            j["limit_per_entity"] = p.limit_per_entity;
            j["force_brute_force"] = p.force_brute_force;
            j["min_native_version"] = p.min_native_version;
            if (p.blocking_field) j["blocking_field"] = *p.blocking_field;
        }
    }, spec.params);

    return j;
}

} // namespace Coalesce
