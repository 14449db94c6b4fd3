#include "rules/code_shape.hpp"
#include <cctype>
#include <stdexcept>

namespace zpdes {

namespace {

bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

// Start of a trailing "<letter><digits>" segment, or npos.
size_t trailingSegment(const std::string& code, char letter) {
    size_t i = code.size();
    while (i > 0 && isDigit(code[i - 1])) --i;
    if (i == code.size() || i == 0) return std::string::npos;
    if (code[i - 1] != letter) return std::string::npos;
    return i - 1;
}

bool allDigits(const std::string& text, size_t from, size_t to) {
    if (from >= to) return false;
    for (size_t i = from; i < to; ++i) {
        if (!isDigit(text[i])) return false;
    }
    return true;
}

} // namespace

std::string trim(const std::string& text) {
    size_t i = 0, j = text.size();
    while (i < j && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    while (j > i && std::isspace(static_cast<unsigned char>(text[j - 1]))) --j;
    return text.substr(i, j - i);
}

CodeShape codeShape(const std::string& code) {
    if (code.size() < 2 || code[0] != 'M') return CodeShape::Other;
    size_t o = code.find('O');
    size_t a = code.find('A');
    if (o == std::string::npos) {
        return allDigits(code, 1, code.size()) ? CodeShape::Module : CodeShape::Other;
    }
    if (!allDigits(code, 1, o)) return CodeShape::Other;
    if (a == std::string::npos) {
        return allDigits(code, o + 1, code.size()) ? CodeShape::Objective : CodeShape::Other;
    }
    if (a < o || !allDigits(code, o + 1, a) || !allDigits(code, a + 1, code.size())) {
        return CodeShape::Other;
    }
    return CodeShape::Activity;
}

UnitKind unitKindFromCode(const std::string& code) {
    return trailingSegment(code, 'O') != std::string::npos ? UnitKind::Objective
                                                           : UnitKind::Activity;
}

std::string objectiveCodeOf(const std::string& code) {
    size_t a = trailingSegment(code, 'A');
    if (a == std::string::npos || a == 0) return "";
    std::string prefix = code.substr(0, a);
    if (trailingSegment(prefix, 'O') == std::string::npos) return "";
    return prefix;
}

std::optional<int> activityIndexOf(const std::string& code) {
    size_t a = trailingSegment(code, 'A');
    if (a == std::string::npos) return std::nullopt;
    try {
        return std::stoi(code.substr(a + 1));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<int> moduleNumberOf(const std::string& code) {
    if (codeShape(code) != CodeShape::Module) return std::nullopt;
    try {
        return std::stoi(code.substr(1));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace zpdes
