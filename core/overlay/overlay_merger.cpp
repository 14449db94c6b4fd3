#include "overlay/overlay_merger.hpp"
#include "util/logging.hpp"

#include <cctype>
#include <stdexcept>

namespace zpdes {

namespace {

bool isIsoDate(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return false;
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
    }
    return true;
}

struct WeightedSums {
    double attempts = 0.0;
    double success = 0.0;
    double repeat = 0.0;

    void add(const DailyActivityRow& row) {
        attempts += row.attempts;
        success += row.success_rate * row.attempts;
        repeat += row.repeat_attempt_rate * row.attempts;
    }

    OverlayMetrics metrics() const {
        OverlayMetrics m;
        m.attempts = attempts;
        if (attempts > 0.0) {
            m.success_rate = success / attempts;
            m.repeat_attempt_rate = repeat / attempts;
        }
        return m;
    }
};

} // namespace

Graph OverlayMerger::mergeOverlays(const Graph& graph, const MetricsByUnit& metrics) {
    std::vector<Unit> units = graph.units();
    for (Unit& unit : units) {
        unit.overlay.reset();
        if (unit.is_ghost) continue;
        auto it = metrics.find(unit.id);
        if (it != metrics.end()) unit.overlay = it->second;
    }
    return Graph(graph.moduleId(), std::move(units), graph.edges());
}

MetricsByUnit OverlayMerger::aggregateDailyMetrics(const std::vector<DailyActivityRow>& rows,
                                                   const std::string& module_id,
                                                   const std::string& start_date,
                                                   const std::string& end_date) {
    if (!isIsoDate(start_date)) throw std::invalid_argument("Bad start date: " + start_date);
    if (!isIsoDate(end_date)) throw std::invalid_argument("Bad end date: " + end_date);

    std::unordered_map<std::string, WeightedSums> activity_sums;
    std::unordered_map<std::string, WeightedSums> objective_sums;
    size_t skipped = 0;

    for (const DailyActivityRow& row : rows) {
        if (row.module_id != module_id) continue;
        if (!isIsoDate(row.date_utc)) {
            ++skipped;
            continue;
        }
        // ISO dates order lexicographically.
        if (row.date_utc < start_date || row.date_utc > end_date) continue;
        if (!row.activity_id.empty()) activity_sums[row.activity_id].add(row);
        if (!row.objective_id.empty()) objective_sums[row.objective_id].add(row);
    }
    if (skipped) {
        log::logger()->warn("Module {}: skipped {} daily rows with malformed dates",
                            module_id, skipped);
    }

    MetricsByUnit out;
    for (const auto& [id, sums] : objective_sums) out[id] = sums.metrics();
    for (const auto& [id, sums] : activity_sums) out[id] = sums.metrics();
    return out;
}

} // namespace zpdes
