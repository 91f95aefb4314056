#include <hashing/deterministic_keys.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <algorithm>

namespace Coalesce {

// Unit separator; keeps ("ab", "c") and ("a", "bc") apart.
static constexpr char SEP = '\x1f';

std::string edge_key(const std::string& a, const std::string& b) {
    const std::string& lo = (a < b) ? a : b;
    const std::string& hi = (a < b) ? b : a;
    return BLAKE3Pipeline::Hasher().update(lo).update(SEP).update(hi).finalize_hex();
}

std::string directed_edge_key(const std::string& from, const std::string& to) {
    return BLAKE3Pipeline::Hasher().update(from).update("->").update(to).finalize_hex();
}

std::string member_set_key(std::vector<std::string> members) {
    std::sort(members.begin(), members.end());
    members.erase(std::unique(members.begin(), members.end()), members.end());

    BLAKE3Pipeline::Hasher hasher;
    for (size_t i = 0; i < members.size(); ++i) {
        if (i) hasher.update('|');
        hasher.update(members[i]);
    }
    return hasher.finalize_hex();
}

} // namespace Coalesce
