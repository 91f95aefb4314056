#include <utils/identifiers.hpp>
#include <utils/errors.hpp>

namespace Coalesce {

static constexpr size_t MAX_IDENTIFIER_LENGTH = 63;

static bool is_ident_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

static bool is_ident_char(char c) {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

bool is_valid_identifier(const std::string& name) noexcept {
    if (name.empty() || name.size() > MAX_IDENTIFIER_LENGTH) return false;
    if (!is_ident_start(name[0])) return false;
    for (char c : name) {
        if (!is_ident_char(c)) return false;
    }
    return true;
}

void validate_identifier(const std::string& name, const std::string& what) {
    if (!is_valid_identifier(name)) {
        throw ValidationError("invalid " + what + " name '" + name + "'");
    }
}

void validate_identifiers(const std::vector<std::string>& names, const std::string& what) {
    for (const auto& n : names) validate_identifier(n, what);
}

} // namespace Coalesce
