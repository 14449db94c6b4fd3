#pragma once

#include "graph/dependency.hpp"
#include "diagnostics/diagnostic.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace zpdes {

/// One parsed prerequisite condition. No threshold means mere exposure.
struct Requirement {
    std::string source_code;
    std::optional<Threshold> threshold;

    bool operator==(const Requirement& other) const {
        return source_code == other.source_code && threshold == other.threshold;
    }
};

/// All requirements of one direction for one target unit.
/// `target_id` holds the reference as written in the rule source: a code,
/// or an id when the source keys rules by id.
struct RuleSpec {
    std::string target_id;
    DependencyKind kind = DependencyKind::Activation;
    std::vector<Requirement> requirements;
    bool initially_open = false;
};

/// Raw rule entry for one target unit, as delivered by the loading layer.
struct RulePayload {
    std::vector<std::string> activation_requirements;
    std::vector<std::string> deactivation_requirements;
    bool initially_open = false;
};

/// Target code → payload, for one module.
using ModuleRules = std::map<std::string, RulePayload>;

enum class ParseMode {
    Lenient,   // drop the bad requirement, record a TokenParseError diagnostic
    Strict,    // abort the module import with RuleImportError
};

struct ParsedRule {
    RuleSpec activation;
    RuleSpec deactivation;
};

// ─── Token grammar ─────────────────────────────────────────────
//   CODE          unconditional prerequisite
//   CODE@P%       success rate, P in [0,100] (integer or decimal)
//   CODE(P%)      same, legacy spelling
//   CODE#L        level, L a non-negative integer

/// Throws TokenParseError on an empty code or malformed suffix.
Requirement parseRequirement(const std::string& token);

/// Splits on commas, semicolons and whitespace; drops repeated
/// (code, threshold) pairs. Throws TokenParseError on the first bad token.
std::vector<Requirement> parseRequirementList(const std::string& text);

/// Parses both requirement lists of a payload. A bad token is dropped with
/// a diagnostic in Lenient mode and throws RuleImportError in Strict mode.
ParsedRule parseRulePayload(const std::string& target, const RulePayload& raw,
                            ParseMode mode, DiagnosticSink& sink);

} // namespace zpdes
