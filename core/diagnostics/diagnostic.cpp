#include "diagnostics/diagnostic.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace zpdes {

const char* toString(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::TokenParseError:         return "TokenParseError";
        case DiagnosticKind::AmbiguousCodeResolution: return "AmbiguousCodeResolution";
        case DiagnosticKind::UnresolvedReference:     return "UnresolvedReference";
        case DiagnosticKind::UnsupportedModule:       return "UnsupportedModule";
        case DiagnosticKind::GraphIntegrityWarning:   return "GraphIntegrityWarning";
        case DiagnosticKind::SelfLoopRejected:        return "SelfLoopRejected";
        case DiagnosticKind::UnusedEnrichment:        return "UnusedEnrichment";
    }
    return "Unknown";
}

size_t countDiagnostics(const std::vector<Diagnostic>& diagnostics, DiagnosticKind kind) {
    return static_cast<size_t>(std::count_if(
        diagnostics.begin(), diagnostics.end(),
        [kind](const Diagnostic& d) { return d.kind == kind; }));
}

namespace {

spdlog::level::level_enum levelFor(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::AmbiguousCodeResolution:
        case DiagnosticKind::UnresolvedReference:
        case DiagnosticKind::UnusedEnrichment:
            return spdlog::level::debug;
        default:
            return spdlog::level::warn;
    }
}

} // namespace

void DiagnosticSink::record(DiagnosticKind kind, std::string subject, std::string message) {
    log::logger()->log(levelFor(kind), "[{}] {}: {}", toString(kind), subject, message);
    seen_.emplace(kind, subject);
    diagnostics_.push_back(Diagnostic{kind, std::move(subject), std::move(message)});
}

bool DiagnosticSink::recordOnce(DiagnosticKind kind, const std::string& subject,
                                std::string message) {
    if (seen_.count({kind, subject})) return false;
    record(kind, subject, std::move(message));
    return true;
}

std::vector<Diagnostic> DiagnosticSink::take() {
    std::vector<Diagnostic> out = std::move(diagnostics_);
    diagnostics_.clear();
    seen_.clear();
    return out;
}

} // namespace zpdes
