#pragma once

#include "graph/graph.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace zpdes {

/// Unit id → overlay metrics. Activity and objective ids share the map.
using MetricsByUnit = std::unordered_map<std::string, OverlayMetrics>;

/// One day of attempt statistics for one activity.
struct DailyActivityRow {
    std::string date_utc;       // YYYY-MM-DD
    std::string module_id;
    std::string objective_id;
    std::string activity_id;
    double attempts = 0.0;
    double success_rate = 0.0;
    double repeat_attempt_rate = 0.0;
};

// ─── OverlayMerger ─────────────────────────────────────────────
// Attaches externally computed metrics to units. Returns new graphs;
// topology is never touched and ghost units never carry an overlay.

class OverlayMerger {
public:
    /// Each real unit's overlay is set from `metrics` when present and
    /// cleared otherwise. Idempotent.
    static Graph mergeOverlays(const Graph& graph, const MetricsByUnit& metrics);

    /// Folds daily rows of one module within [start_date, end_date]
    /// (inclusive, ISO dates) into per-activity and per-objective metrics.
    /// Rates are attempt-weighted. Throws std::invalid_argument on a
    /// malformed window date.
    static MetricsByUnit aggregateDailyMetrics(const std::vector<DailyActivityRow>& rows,
                                               const std::string& module_id,
                                               const std::string& start_date,
                                               const std::string& end_date);
};

} // namespace zpdes
