#pragma once

#include <string>
#include <vector>

namespace Coalesce {

/**
 * @brief Check a collection or field name.
 *
 * Names are interpolated into store queries, so only [A-Za-z_][A-Za-z0-9_]*
 * up to 63 characters is accepted. Throws ValidationError otherwise.
 *
 * @param what Describes the name in the error message ("collection", "field").
 */
void validate_identifier(const std::string& name, const std::string& what);

void validate_identifiers(const std::vector<std::string>& names, const std::string& what);

bool is_valid_identifier(const std::string& name) noexcept;

} // namespace Coalesce
