#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace zpdes {

/// Modules every source agrees on: rules ∩ catalog, further intersected
/// with the observed modules when that set is supplied and non-empty.
/// Sorted by module number (M2 before M10), other codes last.
std::vector<std::string> supportedModules(
    const std::set<std::string>& rule_module_ids,
    const std::set<std::string>& catalog_module_ids,
    const std::optional<std::set<std::string>>& observed_module_ids = std::nullopt);

bool isSupportedModule(const std::string& module_id, const std::vector<std::string>& supported);

/// Throws UnsupportedModuleError when `module_id` is not in `supported`.
void requireSupportedModule(const std::string& module_id,
                            const std::vector<std::string>& supported);

} // namespace zpdes
