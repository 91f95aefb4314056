#include <blocking/exact_blocking.hpp>
#include <similarity/string_similarity.hpp>
#include <utils/errors.hpp>
#include <utils/identifiers.hpp>

namespace Coalesce {

static constexpr char KEY_SEPARATOR = '\x1f';

static std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

ExactBlocking::ExactBlocking(Store& store, BlockingSource source, ExactBlockingParams params)
    : BlockingStrategy(store, "exact", std::move(source)), params_(std::move(params)) {
    if (params_.fields.empty()) {
        throw ConfigurationError("exact blocking requires at least one blocking field");
    }
    validate_identifiers(params_.fields, "blocking field");
}

void ExactBlocking::collect(CandidateSet& out) {
    std::map<std::string, std::vector<std::string>> blocks;

    for_each_record([&](const Record& record) {
        std::string key;
        for (size_t i = 0; i < params_.fields.size(); ++i) {
            auto value = record.text(params_.fields[i]);
            if (!value) {
                ++stats_.records_skipped;
                return;
            }
            if (i) key.push_back(KEY_SEPARATOR);
            key += params_.case_sensitive ? trim(*value) : normalize_text(*value);
        }
        blocks[key].push_back(record.id);
    });

    stats_.details["distinct_keys"] = std::to_string(blocks.size());
    emit_blocks(blocks, out);
}

} // namespace Coalesce
