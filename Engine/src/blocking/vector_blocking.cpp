#include <blocking/vector_blocking.hpp>
#include <utils/errors.hpp>
#include <utils/identifiers.hpp>
#include <utils/logger.hpp>
#include <iomanip>
#include <sstream>

namespace Coalesce {

VectorBlocking::VectorBlocking(Store& store, BlockingSource source, VectorBlockingParams params)
    : BlockingStrategy(store, "vector", std::move(source)), params_(std::move(params)) {
    validate_identifier(params_.embedding_field, "embedding field");
    if (params_.blocking_field) validate_identifier(*params_.blocking_field, "blocking field");

    if (params_.similarity_threshold < 0.0 || params_.similarity_threshold > 1.0) {
        throw ConfigurationError("vector blocking similarity_threshold must be in [0, 1]");
    }
    if (params_.limit_per_entity == 0) {
        throw ConfigurationError("vector blocking limit_per_entity must be at least 1");
    }

    adapter_ = std::make_unique<AnnAdapter>(store_, adapter_options(params_.force_brute_force));
}

AnnAdapterOptions VectorBlocking::adapter_options(bool force_brute_force) const {
    AnnAdapterOptions opts;
    opts.collection = source_.collection;
    opts.embedding_field = params_.embedding_field;
    opts.force_brute_force = force_brute_force;
    opts.min_native_version = params_.min_native_version;
    opts.page_size = source_.page_size;
    return opts;
}

void VectorBlocking::collect(CandidateSet& out) {
    std::vector<VectorPair> pairs;
    try {
        pairs = adapter_->find_all_pairs(params_.similarity_threshold, params_.limit_per_entity,
                                         params_.blocking_field, source_.filters);
    } catch (const std::exception& e) {
        Logger::warn(std::string("Vector blocking failed, retrying once with brute force: ") + e.what());
        AnnAdapter brute(store_, adapter_options(true));
        pairs = brute.find_all_pairs(params_.similarity_threshold, params_.limit_per_entity,
                                     params_.blocking_field, source_.filters);
    }

    last_method_ = pairs.empty() ? adapter_->method() : pairs.front().method;

    for (const auto& p : pairs) {
        std::ostringstream key;
        key << "cos:" << std::fixed << std::setprecision(4) << p.similarity;
        out.add(p.first_id, p.second_id, key.str());
    }

    stats_.blocks_formed = pairs.size();
    stats_.details["method"] = last_method_;
    stats_.details["similarity_threshold"] = std::to_string(params_.similarity_threshold);
    stats_.details["limit_per_entity"] = std::to_string(params_.limit_per_entity);
}

} // namespace Coalesce
