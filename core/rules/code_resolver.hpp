#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace zpdes {

using CodeToIds = std::map<std::string, std::vector<std::string>>;
using IdToCodes = std::map<std::string, std::vector<std::string>>;

// ─── CodeResolver ──────────────────────────────────────────────
// Bidirectional mapping between canonical unit ids and the short codes
// rules are written in. Built once, read-only afterwards. Candidate
// lists are trimmed, de-duplicated and sorted so that resolution is
// deterministic.

class CodeResolver {
public:
    CodeResolver() = default;

    /// `id_to_codes` is merged with the inverse of `code_to_id`.
    explicit CodeResolver(const CodeToIds& code_to_id, const IdToCodes& id_to_codes = {});

    /// From a flat code → id table (one id per code).
    static CodeResolver fromCodeTable(const std::map<std::string, std::string>& code_to_id);

    /// Candidate ids for a code, sorted; empty when unknown.
    std::vector<std::string> resolveCode(const std::string& code) const;

    /// Known codes of an id, sorted; empty when none.
    std::vector<std::string> codesFor(const std::string& id) const;

    bool isKnownId(const std::string& id) const;

    /// Display code for an id with several codes: activity-shaped first,
    /// then objective, module, anything else; longer before shorter;
    /// then lexicographic.
    std::optional<std::string> preferredCode(const std::string& id) const;

private:
    std::unordered_map<std::string, std::vector<std::string>> code_to_id_;
    std::unordered_map<std::string, std::vector<std::string>> id_to_codes_;
};

} // namespace zpdes
