#include <blocking/sorted_neighborhood_blocking.hpp>
#include <similarity/string_similarity.hpp>
#include <utils/errors.hpp>
#include <utils/identifiers.hpp>
#include <algorithm>

namespace Coalesce {

SortedNeighborhoodBlocking::SortedNeighborhoodBlocking(Store& store, BlockingSource source,
                                                       SortedNeighborhoodParams params)
    : BlockingStrategy(store, "sorted_neighborhood", std::move(source)), params_(std::move(params)) {
    if (params_.key_fields.empty()) {
        throw ConfigurationError("sorted neighborhood blocking requires at least one key field");
    }
    validate_identifiers(params_.key_fields, "key field");
    if (params_.window_size < 2) {
        throw ConfigurationError("sorted neighborhood window_size must be at least 2");
    }
}

void SortedNeighborhoodBlocking::collect(CandidateSet& out) {
    std::vector<std::pair<std::string, std::string>> keyed;  // (sort key, id)

    for_each_record([&](const Record& record) {
        std::string key;
        bool any = false;
        for (size_t i = 0; i < params_.key_fields.size(); ++i) {
            if (i) key.push_back(' ');
            if (auto value = record.text(params_.key_fields[i])) {
                key += normalize_text(*value);
                any = true;
            }
        }
        if (!any) {
            ++stats_.records_skipped;
            return;
        }
        keyed.emplace_back(std::move(key), record.id);
    });

    std::sort(keyed.begin(), keyed.end());

    const size_t n = keyed.size();
    for (size_t i = 0; i + 1 < n; ++i) {
        const size_t end = std::min(n, i + params_.window_size);
        for (size_t j = i + 1; j < end; ++j) {
            out.add(keyed[i].second, keyed[j].second, keyed[i].first);
        }
    }

    stats_.blocks_formed = n >= params_.window_size ? n - params_.window_size + 1 : (n >= 2 ? 1 : 0);
    stats_.details["window_size"] = std::to_string(params_.window_size);
}

} // namespace Coalesce
