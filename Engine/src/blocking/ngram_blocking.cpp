#include <blocking/ngram_blocking.hpp>
#include <similarity/string_similarity.hpp>
#include <utils/errors.hpp>
#include <utils/identifiers.hpp>

namespace Coalesce {

NGramBlocking::NGramBlocking(Store& store, BlockingSource source, NGramBlockingParams params)
    : BlockingStrategy(store, "ngram", std::move(source)), params_(std::move(params)) {
    if (params_.field.empty()) {
        throw ConfigurationError("ngram blocking requires a blocking field");
    }
    validate_identifier(params_.field, "blocking field");
    if (params_.prefix_length == 0 && params_.n == 0) {
        throw ConfigurationError("ngram blocking requires n > 0 or prefix_length > 0");
    }
}

std::vector<std::string> NGramBlocking::keys_for(const std::string& value) const {
    std::vector<std::string> keys;
    const std::string norm = normalize_text(value);
    if (norm.empty()) return keys;

    if (params_.prefix_length > 0) {
        keys.push_back("px:" + norm.substr(0, params_.prefix_length));
        return keys;
    }
    for (const auto& gram : char_ngrams(norm, params_.n)) {
        keys.push_back("ng:" + gram);
    }
    return keys;
}

void NGramBlocking::collect(CandidateSet& out) {
    std::map<std::string, std::vector<std::string>> blocks;

    for_each_record([&](const Record& record) {
        auto value = record.text(params_.field);
        if (!value) {
            ++stats_.records_skipped;
            return;
        }
        for (const auto& key : keys_for(*value)) {
            blocks[key].push_back(record.id);
        }
    });

    stats_.details["distinct_keys"] = std::to_string(blocks.size());
    emit_blocks(blocks, out);
}

} // namespace Coalesce
