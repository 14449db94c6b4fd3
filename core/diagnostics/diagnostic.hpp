#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace zpdes {

enum class DiagnosticKind {
    TokenParseError,
    AmbiguousCodeResolution,
    UnresolvedReference,
    UnsupportedModule,
    GraphIntegrityWarning,
    SelfLoopRejected,
    UnusedEnrichment,
};

const char* toString(DiagnosticKind kind);

/// One non-fatal issue found while building or querying a graph.
/// `subject` names what it is about (a token, code, unit or edge id).
struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::GraphIntegrityWarning;
    std::string subject;
    std::string message;

    bool operator==(const Diagnostic& other) const {
        return kind == other.kind && subject == other.subject && message == other.message;
    }
};

size_t countDiagnostics(const std::vector<Diagnostic>& diagnostics, DiagnosticKind kind);

// ─── DiagnosticSink ────────────────────────────────────────────
// Collects diagnostics in order for one build or query call and mirrors
// each to the zpdes logger. The collected list is what callers get back.

class DiagnosticSink {
public:
    void record(DiagnosticKind kind, std::string subject, std::string message);

    /// Records only the first diagnostic per (kind, subject).
    /// Returns false when it was already recorded.
    bool recordOnce(DiagnosticKind kind, const std::string& subject, std::string message);

    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }
    size_t count(DiagnosticKind kind) const { return countDiagnostics(diagnostics_, kind); }
    bool empty() const { return diagnostics_.empty(); }

    std::vector<Diagnostic> take();

private:
    std::vector<Diagnostic> diagnostics_;
    std::set<std::pair<DiagnosticKind, std::string>> seen_;
};

} // namespace zpdes
