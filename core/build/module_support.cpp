#include "build/module_support.hpp"
#include "diagnostics/errors.hpp"
#include "rules/code_shape.hpp"

#include <algorithm>
#include <limits>
#include <tuple>

namespace zpdes {

namespace {

std::set<std::string> cleaned(const std::set<std::string>& ids) {
    std::set<std::string> out;
    for (const auto& id : ids) {
        std::string t = trim(id);
        if (!t.empty()) out.insert(t);
    }
    return out;
}

} // namespace

std::vector<std::string> supportedModules(
    const std::set<std::string>& rule_module_ids,
    const std::set<std::string>& catalog_module_ids,
    const std::optional<std::set<std::string>>& observed_module_ids) {
    std::set<std::string> rules = cleaned(rule_module_ids);
    std::set<std::string> catalog = cleaned(catalog_module_ids);
    std::set<std::string> observed;
    if (observed_module_ids) observed = cleaned(*observed_module_ids);

    std::vector<std::string> out;
    for (const auto& id : rules) {
        if (!catalog.count(id)) continue;
        if (!observed.empty() && !observed.count(id)) continue;
        out.push_back(id);
    }

    auto key = [](const std::string& id) {
        return std::make_tuple(moduleNumberOf(id).value_or(std::numeric_limits<int>::max()), id);
    };
    std::sort(out.begin(), out.end(), [&](const std::string& a, const std::string& b) {
        return key(a) < key(b);
    });
    return out;
}

bool isSupportedModule(const std::string& module_id, const std::vector<std::string>& supported) {
    return std::find(supported.begin(), supported.end(), trim(module_id)) != supported.end();
}

void requireSupportedModule(const std::string& module_id,
                            const std::vector<std::string>& supported) {
    if (!isSupportedModule(module_id, supported)) {
        throw UnsupportedModuleError(module_id);
    }
}

} // namespace zpdes
