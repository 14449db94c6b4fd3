#pragma once

#include <optional>
#include <string>
#include <utility>

namespace zpdes {

enum class UnitKind { Activity, Objective };

inline const char* toString(UnitKind kind) {
    return kind == UnitKind::Objective ? "objective" : "activity";
}

/// Externally computed performance metrics attached to a unit.
/// Never affects graph topology.
struct OverlayMetrics {
    double attempts = 0.0;
    double success_rate = 0.0;
    double repeat_attempt_rate = 0.0;

    bool operator==(const OverlayMetrics& other) const {
        return attempts == other.attempts &&
               success_rate == other.success_rate &&
               repeat_attempt_rate == other.repeat_attempt_rate;
    }
    bool operator!=(const OverlayMetrics& other) const { return !(*this == other); }
};

/// A pedagogical unit (activity or objective) in a module's dependency graph.
/// Empty strings stand for absent code, label or parent objective.
struct Unit {
    std::string id;
    UnitKind kind = UnitKind::Activity;
    std::string module_id;
    std::string code;
    std::string label;
    std::string objective_id;   // parent objective, activities only
    bool is_ghost = false;
    bool initially_open = false;
    std::optional<OverlayMetrics> overlay;

    Unit() = default;
    Unit(std::string id, UnitKind kind, std::string module_id)
        : id(std::move(id)), kind(kind), module_id(std::move(module_id)) {}

    bool isActivity() const { return kind == UnitKind::Activity; }
    bool isObjective() const { return kind == UnitKind::Objective; }

    /// The objective a unit belongs to: itself for objectives.
    const std::string& owningObjective() const {
        return isObjective() ? id : objective_id;
    }

    /// Code when known, raw id otherwise.
    const std::string& displayCode() const { return code.empty() ? id : code; }

    bool operator==(const Unit& other) const {
        return id == other.id && kind == other.kind &&
               module_id == other.module_id && code == other.code &&
               label == other.label && objective_id == other.objective_id &&
               is_ghost == other.is_ghost &&
               initially_open == other.initially_open &&
               overlay == other.overlay;
    }
    bool operator!=(const Unit& other) const { return !(*this == other); }
};

} // namespace zpdes
