#include <blocking/phonetic_blocking.hpp>
#include <similarity/string_similarity.hpp>
#include <utils/errors.hpp>
#include <utils/identifiers.hpp>

namespace Coalesce {

PhoneticBlocking::PhoneticBlocking(Store& store, BlockingSource source, PhoneticBlockingParams params)
    : BlockingStrategy(store, "phonetic", std::move(source)), params_(std::move(params)) {
    if (params_.fields.empty()) {
        throw ConfigurationError("phonetic blocking requires at least one name field");
    }
    validate_identifiers(params_.fields, "blocking field");
}

void PhoneticBlocking::collect(CandidateSet& out) {
    std::map<std::string, std::vector<std::string>> blocks;

    for_each_record([&](const Record& record) {
        std::string key;
        for (size_t i = 0; i < params_.fields.size(); ++i) {
            auto value = record.text(params_.fields[i]);
            std::string code = value ? soundex(*value) : "0000";
            // A code without a leading letter carries no phonetic information
            if (code == "0000") {
                ++stats_.records_skipped;
                return;
            }
            if (i) key.push_back('-');
            key += code;
        }
        blocks[key].push_back(record.id);
    });

    stats_.details["distinct_codes"] = std::to_string(blocks.size());
    emit_blocks(blocks, out);
}

} // namespace Coalesce
