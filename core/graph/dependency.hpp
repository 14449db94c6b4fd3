#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace zpdes {

enum class DependencyKind { Activation, Deactivation };

enum class ThresholdMetric { SuccessRate, Level };

inline const char* toString(DependencyKind kind) {
    return kind == DependencyKind::Deactivation ? "deactivation" : "activation";
}

inline const char* toString(ThresholdMetric metric) {
    return metric == ThresholdMetric::Level ? "level" : "success_rate";
}

/// Performance bar attached to a requirement.
/// success_rate lies in [0,1]; level is a non-negative integer.
struct Threshold {
    ThresholdMetric metric = ThresholdMetric::SuccessRate;
    double value = 0.0;

    Threshold() = default;
    Threshold(ThresholdMetric metric, double value) : metric(metric), value(value) {}

    static Threshold successRate(double rate) { return {ThresholdMetric::SuccessRate, rate}; }
    static Threshold level(int lvl) { return {ThresholdMetric::Level, static_cast<double>(lvl)}; }

    bool operator==(const Threshold& other) const {
        return metric == other.metric && value == other.value;
    }
    bool operator!=(const Threshold& other) const { return !(*this == other); }
};

/// True when `a` demands strictly more than `b`. Any threshold is stricter
/// than none; thresholds on different metrics are not comparable.
inline bool isStricter(const std::optional<Threshold>& a, const std::optional<Threshold>& b) {
    if (!a) return false;
    if (!b) return true;
    return a->metric == b->metric && a->value > b->value;
}

/// A directed dependency: prerequisite (from) → target (to).
struct Dependency {
    std::string edge_id;
    std::string from_id;
    std::string to_id;
    DependencyKind kind = DependencyKind::Activation;
    std::optional<Threshold> threshold;
    bool is_inferred = false;                  // synthesized by objective bridging
    std::string source_code;                   // rule token the prerequisite came from
    std::map<std::string, double> enrichment;  // e.g. {"sr": 0.7, "lvl": 2}

    Dependency() = default;
    Dependency(std::string from, std::string to, DependencyKind kind,
               std::optional<Threshold> threshold = std::nullopt)
        : from_id(std::move(from)), to_id(std::move(to)), kind(kind),
          threshold(threshold) {}

    bool isActivation() const { return kind == DependencyKind::Activation; }

    bool operator==(const Dependency& other) const {
        return edge_id == other.edge_id && from_id == other.from_id &&
               to_id == other.to_id && kind == other.kind &&
               threshold == other.threshold && is_inferred == other.is_inferred &&
               source_code == other.source_code && enrichment == other.enrichment;
    }
    bool operator!=(const Dependency& other) const { return !(*this == other); }
};

} // namespace zpdes
