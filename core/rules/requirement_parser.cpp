#include "rules/requirement_parser.hpp"
#include "rules/code_shape.hpp"
#include "diagnostics/errors.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace zpdes {

namespace {

bool isCodeChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' ||
           c == '.' || c == ':';
}

std::string parseCode(const std::string& token, const std::string& raw_code) {
    std::string code = trim(raw_code);
    if (code.empty()) {
        throw TokenParseError(token, "empty code");
    }
    for (char c : code) {
        if (!isCodeChar(c)) {
            throw TokenParseError(token, std::string("invalid character '") + c + "' in code");
        }
    }
    return code;
}

// [-]digits[.digits]
bool isDecimal(const std::string& text) {
    size_t i = 0;
    if (i < text.size() && text[i] == '-') ++i;
    size_t int_digits = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        ++i;
        ++int_digits;
    }
    if (int_digits == 0) return false;
    if (i == text.size()) return true;
    if (text[i] != '.') return false;
    ++i;
    size_t frac_digits = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        ++i;
        ++frac_digits;
    }
    return frac_digits > 0 && i == text.size();
}

Threshold parsePercent(const std::string& token, const std::string& suffix) {
    std::string body = trim(suffix);
    if (body.size() < 2 || body.back() != '%') {
        throw TokenParseError(token, "percentage threshold must end with '%'");
    }
    std::string number = trim(body.substr(0, body.size() - 1));
    if (!isDecimal(number)) {
        throw TokenParseError(token, "percentage '" + number + "' is not a number");
    }
    double pct = 0.0;
    try {
        pct = std::stod(number);
    } catch (const std::out_of_range&) {
        throw TokenParseError(token, "percentage " + number + " outside [0,100]");
    }
    if (pct < 0.0 || pct > 100.0) {
        throw TokenParseError(token, "percentage " + number + " outside [0,100]");
    }
    return Threshold::successRate(std::clamp(pct / 100.0, 0.0, 1.0));
}

Threshold parseLevel(const std::string& token, const std::string& suffix) {
    std::string body = trim(suffix);
    if (body.empty()) {
        throw TokenParseError(token, "missing level after '#'");
    }
    bool digits = std::all_of(body.begin(), body.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
    if (!digits) {
        throw TokenParseError(token, "level '" + body + "' is not a non-negative integer");
    }
    if (body.size() > 9) {
        throw TokenParseError(token, "level '" + body + "' too large");
    }
    return Threshold::level(std::stoi(body));
}

} // namespace

Requirement parseRequirement(const std::string& token) {
    std::string text = trim(token);
    if (text.empty()) {
        throw TokenParseError(token, "empty token");
    }

    size_t at = text.find('@');
    size_t hash = text.find('#');
    size_t paren = text.find('(');
    int markers = (at != std::string::npos) + (hash != std::string::npos) +
                  (paren != std::string::npos);
    if (markers > 1) {
        throw TokenParseError(token, "more than one threshold suffix");
    }

    Requirement req;
    if (at != std::string::npos) {
        req.source_code = parseCode(token, text.substr(0, at));
        req.threshold = parsePercent(token, text.substr(at + 1));
    } else if (hash != std::string::npos) {
        req.source_code = parseCode(token, text.substr(0, hash));
        req.threshold = parseLevel(token, text.substr(hash + 1));
    } else if (paren != std::string::npos) {
        if (text.back() != ')') {
            throw TokenParseError(token, "unterminated '(' suffix");
        }
        req.source_code = parseCode(token, text.substr(0, paren));
        req.threshold = parsePercent(token, text.substr(paren + 1, text.size() - paren - 2));
    } else {
        req.source_code = parseCode(token, text);
    }
    return req;
}

std::vector<Requirement> parseRequirementList(const std::string& text) {
    std::vector<Requirement> out;

    std::string current;
    auto flush = [&]() {
        if (trim(current).empty()) {
            current.clear();
            return;
        }
        Requirement req = parseRequirement(current);
        current.clear();
        if (std::find(out.begin(), out.end(), req) == out.end()) {
            out.push_back(std::move(req));
        }
    };

    for (char c : text) {
        if (c == ',' || c == ';' || std::isspace(static_cast<unsigned char>(c))) {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return out;
}

ParsedRule parseRulePayload(const std::string& target, const RulePayload& raw,
                            ParseMode mode, DiagnosticSink& sink) {
    ParsedRule parsed;
    std::string target_ref = trim(target);

    auto parse_into = [&](const std::vector<std::string>& tokens, RuleSpec& spec,
                          DependencyKind kind) {
        spec.target_id = target_ref;
        spec.kind = kind;
        spec.initially_open = raw.initially_open;
        for (const std::string& token : tokens) {
            try {
                spec.requirements.push_back(parseRequirement(token));
            } catch (const TokenParseError& e) {
                if (mode == ParseMode::Strict) {
                    throw RuleImportError(target_ref, e);
                }
                sink.record(DiagnosticKind::TokenParseError, e.token(),
                            std::string("rule for '") + target_ref + "' (" + toString(kind) +
                                "): " + e.reason() + "; requirement dropped");
            }
        }
    };

    parse_into(raw.activation_requirements, parsed.activation, DependencyKind::Activation);
    parse_into(raw.deactivation_requirements, parsed.deactivation, DependencyKind::Deactivation);
    return parsed;
}

} // namespace zpdes
