#include <persistence/merge_policy.hpp>
#include <utils/identifiers.hpp>
#include <map>

namespace Coalesce {

MajorityMergePolicy::MajorityMergePolicy(std::vector<std::string> fields, std::vector<std::string> excluded)
    : fields_(std::move(fields)), excluded_(excluded.begin(), excluded.end()) {
    validate_identifiers(fields_, "merge field");
}

MergeResult MajorityMergePolicy::merge(const std::vector<Record>& members) const {
    std::vector<std::string> fields = fields_;
    if (fields.empty()) {
        std::set<std::string> seen;
        for (const auto& r : members) {
            for (auto it = r.fields.begin(); it != r.fields.end(); ++it) seen.insert(it.key());
        }
        fields.assign(seen.begin(), seen.end());
    }

    struct Tally {
        nlohmann::json value;
        size_t count = 0;
        size_t first_seen = 0;
        std::string source;
    };

    MergeResult result;
    for (const auto& field : fields) {
        if (excluded_.count(field)) continue;

        std::map<std::string, Tally> tallies;   // keyed by serialized value
        size_t order = 0;
        for (const auto& r : members) {
            if (!r.has(field)) continue;
            const auto& v = r.fields.at(field);
            if (v.is_structured()) continue;

            auto [it, inserted] = tallies.emplace(v.dump(), Tally{v, 0, order, r.id});
            ++it->second.count;
            ++order;
        }
        if (tallies.empty()) continue;

        const Tally* best = nullptr;
        for (const auto& [key, t] : tallies) {
            if (!best || t.count > best->count) { best = &t; continue; }
            if (t.count < best->count) continue;

            if (t.value.is_string() && best->value.is_string()) {
                const auto& a = t.value.get_ref<const std::string&>();
                const auto& b = best->value.get_ref<const std::string&>();
                if (a.size() != b.size()) {
                    if (a.size() > b.size()) best = &t;
                    continue;
                }
            }
            if (t.first_seen < best->first_seen) best = &t;
        }

        result.fields[field] = best->value;
        result.provenance[field] = best->source;
    }
    return result;
}

} // namespace Coalesce
