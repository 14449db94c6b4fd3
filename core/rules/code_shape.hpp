#pragma once

#include "graph/unit.hpp"
#include <optional>
#include <string>

namespace zpdes {

// Rule codes are shaped M<n> (module), M<n>O<n> (objective) and
// M<n>O<n>A<n> (activity).

enum class CodeShape { Module, Objective, Activity, Other };

CodeShape codeShape(const std::string& code);

/// Kind of the unit a code names. Codes ending in O<n> are objectives,
/// everything else is treated as an activity.
UnitKind unitKindFromCode(const std::string& code);

/// "M1O3A2" → "M1O3". Empty when the code has no objective prefix.
std::string objectiveCodeOf(const std::string& code);

/// "M1O3A2" → 2.
std::optional<int> activityIndexOf(const std::string& code);

/// "M12" → 12.
std::optional<int> moduleNumberOf(const std::string& code);

std::string trim(const std::string& text);

} // namespace zpdes
