/**
 * @file lsh_blocking.cpp
 * @brief Random-hyperplane LSH blocking
 */

#include <blocking/lsh_blocking.hpp>
#include <similarity/vector_math.hpp>
#include <utils/errors.hpp>
#include <utils/identifiers.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <random>
#include <sstream>

namespace Coalesce {

LshBlocking::LshBlocking(Store& store, BlockingSource source, LshBlockingParams params)
    : BlockingStrategy(store, "lsh", std::move(source)), params_(std::move(params)) {
    validate_identifier(params_.embedding_field, "embedding field");
    if (params_.blocking_field) validate_identifier(*params_.blocking_field, "blocking field");

    if (params_.num_hash_tables == 0) {
        throw ConfigurationError("lsh num_hash_tables must be positive");
    }
    if (params_.num_hyperplanes == 0 || params_.num_hyperplanes > 64) {
        throw ConfigurationError("lsh num_hyperplanes must be in 1..64");
    }
    if (params_.max_bucket_size > 0 && params_.max_bucket_size < source_.min_block_size) {
        throw ConfigurationError("lsh max_bucket_size must be 0 or >= min_block_size");
    }
}

void LshBlocking::prepare(Eigen::Index dimension) {
    if (dimension <= 0) {
        throw ValidationError("embedding dimension must be positive");
    }
    if (dimension == dimension_ && !hyperplanes_.empty()) return;

    std::mt19937_64 rng(params_.seed);
    std::normal_distribution<double> normal(0.0, 1.0);

    const auto k = static_cast<Eigen::Index>(params_.num_hyperplanes);
    hyperplanes_.clear();
    hyperplanes_.reserve(params_.num_hash_tables);

    for (size_t t = 0; t < params_.num_hash_tables; ++t) {
        Eigen::MatrixXd planes(k, dimension);
        for (Eigen::Index h = 0; h < k; ++h) {
            for (Eigen::Index d = 0; d < dimension; ++d) {
                planes(h, d) = normal(rng);
            }
            planes.row(h) /= std::max(planes.row(h).norm(), MIN_VECTOR_MAGNITUDE);
        }
        hyperplanes_.push_back(std::move(planes));
    }
    dimension_ = dimension;
}

std::vector<uint64_t> LshBlocking::signatures(const Eigen::VectorXd& vector) const {
    if (vector.size() != dimension_) {
        throw ValidationError("vector dimension " + std::to_string(vector.size()) +
                              " does not match " + std::to_string(dimension_));
    }

    std::vector<uint64_t> sigs;
    sigs.reserve(hyperplanes_.size());
    for (const auto& planes : hyperplanes_) {
        Eigen::VectorXd projections = planes * vector;
        uint64_t sig = 0;
        for (Eigen::Index h = 0; h < projections.size(); ++h) {
            if (projections[h] > 0.0) sig |= (uint64_t(1) << h);
        }
        sigs.push_back(sig);
    }
    return sigs;
}

void LshBlocking::collect(CandidateSet& out) {
    std::map<std::string, std::vector<std::string>> buckets;
    size_t indexed = 0;
    size_t mismatched = 0;

    for_each_record([&](const Record& record) {
        auto v = record.vector(params_.embedding_field);
        if (!v || as_eigen(*v).norm() < MIN_VECTOR_MAGNITUDE) {
            ++stats_.records_skipped;
            return;
        }
        if (params_.blocking_field && !record.has(*params_.blocking_field)) {
            ++stats_.records_skipped;
            return;
        }

        if (hyperplanes_.empty() || dimension_ != static_cast<Eigen::Index>(v->size())) {
            if (indexed == 0) {
                prepare(static_cast<Eigen::Index>(v->size()));
            } else {
                ++mismatched;
                ++stats_.records_skipped;
                return;
            }
        }

        std::string scope;
        if (params_.blocking_field) scope = record.fields.at(*params_.blocking_field).dump() + "/";

        auto sigs = signatures(unit_vector(*v));
        for (size_t t = 0; t < sigs.size(); ++t) {
            std::ostringstream key;
            key << scope << "t" << t << ":" << std::hex << sigs[t];
            buckets[key.str()].push_back(record.id);
        }
        ++indexed;
    });

    if (indexed == 0) {
        Logger::warn("LSH blocking: no records in " + source_.collection + " carry " + params_.embedding_field);
    } else if (stats_.records_skipped > 0) {
        const double coverage = 100.0 * indexed / static_cast<double>(stats_.records_scanned);
        Logger::warn("LSH blocking: embedding coverage " + std::to_string(coverage) + "% (" +
                     std::to_string(stats_.records_skipped) + " records skipped)");
    }
    if (mismatched > 0) {
        Logger::warn("LSH blocking: " + std::to_string(mismatched) + " vectors with dimension != " +
                     std::to_string(dimension_) + " ignored");
    }

    stats_.details["vectors_indexed"] = std::to_string(indexed);
    stats_.details["total_buckets"] = params_.num_hyperplanes < 48
        ? std::to_string(params_.num_hash_tables * (uint64_t(1) << params_.num_hyperplanes))
        : std::to_string(params_.num_hash_tables) + "x2^" + std::to_string(params_.num_hyperplanes);
    stats_.details["non_empty_buckets"] = std::to_string(buckets.size());
    stats_.details["num_hash_tables"] = std::to_string(params_.num_hash_tables);
    stats_.details["num_hyperplanes"] = std::to_string(params_.num_hyperplanes);

    emit_blocks(buckets, out, params_.max_bucket_size);
}

} // namespace Coalesce
