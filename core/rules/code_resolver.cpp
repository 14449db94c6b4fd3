#include "rules/code_resolver.hpp"
#include "rules/code_shape.hpp"
#include <algorithm>
#include <tuple>

namespace zpdes {

namespace {

void addUnique(std::vector<std::string>& list, const std::string& value) {
    if (std::find(list.begin(), list.end(), value) == list.end()) {
        list.push_back(value);
    }
}

int shapeRank(const std::string& code) {
    switch (codeShape(code)) {
        case CodeShape::Activity:  return 0;
        case CodeShape::Objective: return 1;
        case CodeShape::Module:    return 2;
        default:                   return 3;
    }
}

} // namespace

CodeResolver::CodeResolver(const CodeToIds& code_to_id, const IdToCodes& id_to_codes) {
    for (const auto& [raw_code, raw_ids] : code_to_id) {
        std::string code = trim(raw_code);
        if (code.empty()) continue;
        for (const auto& raw_id : raw_ids) {
            std::string id = trim(raw_id);
            if (id.empty()) continue;
            addUnique(code_to_id_[code], id);
            addUnique(id_to_codes_[id], code);
        }
    }
    for (const auto& [raw_id, raw_codes] : id_to_codes) {
        std::string id = trim(raw_id);
        if (id.empty()) continue;
        for (const auto& raw_code : raw_codes) {
            std::string code = trim(raw_code);
            if (code.empty()) continue;
            addUnique(id_to_codes_[id], code);
        }
    }
    for (auto& [_, ids] : code_to_id_) {
        std::sort(ids.begin(), ids.end());
    }
    for (auto& [_, codes] : id_to_codes_) {
        std::sort(codes.begin(), codes.end());
    }
}

CodeResolver CodeResolver::fromCodeTable(const std::map<std::string, std::string>& code_to_id) {
    CodeToIds table;
    for (const auto& [code, id] : code_to_id) {
        table[code].push_back(id);
    }
    return CodeResolver(table);
}

std::vector<std::string> CodeResolver::resolveCode(const std::string& code) const {
    auto it = code_to_id_.find(trim(code));
    if (it == code_to_id_.end()) return {};
    return it->second;
}

std::vector<std::string> CodeResolver::codesFor(const std::string& id) const {
    auto it = id_to_codes_.find(trim(id));
    if (it == id_to_codes_.end()) return {};
    return it->second;
}

bool CodeResolver::isKnownId(const std::string& id) const {
    return id_to_codes_.count(trim(id)) > 0;
}

std::optional<std::string> CodeResolver::preferredCode(const std::string& id) const {
    std::vector<std::string> codes = codesFor(id);
    if (codes.empty()) return std::nullopt;
    auto key = [](const std::string& code) {
        return std::make_tuple(shapeRank(code), -static_cast<long>(code.size()), code);
    };
    return *std::min_element(codes.begin(), codes.end(),
                             [&](const std::string& a, const std::string& b) {
                                 return key(a) < key(b);
                             });
}

} // namespace zpdes
