#pragma once

#include "diagnostics/diagnostic.hpp"
#include <stdexcept>
#include <string>

namespace zpdes {

/// Malformed requirement token: empty code or bad threshold suffix.
class TokenParseError : public std::runtime_error {
public:
    TokenParseError(std::string token, std::string reason)
        : std::runtime_error("Cannot parse requirement '" + token + "': " + reason),
          token_(std::move(token)), reason_(std::move(reason)) {}

    const std::string& token() const { return token_; }
    const std::string& reason() const { return reason_; }

private:
    std::string token_;
    std::string reason_;
};

/// Strict-mode abort of a module import, naming the rule target it hit.
class RuleImportError : public std::runtime_error {
public:
    RuleImportError(std::string target, const TokenParseError& cause)
        : std::runtime_error("Rule for '" + target + "': " + cause.what()),
          target_(std::move(target)), token_(cause.token()) {}

    RuleImportError(std::string target, const std::string& message)
        : std::runtime_error("Rule for '" + target + "': " + message),
          target_(std::move(target)) {}

    const std::string& target() const { return target_; }
    const std::string& token() const { return token_; }

private:
    std::string target_;
    std::string token_;
};

/// Graph requested for a module outside the module support set.
class UnsupportedModuleError : public std::runtime_error {
public:
    explicit UnsupportedModuleError(std::string module_id)
        : std::runtime_error("Module not supported by all sources: " + module_id),
          module_id_(std::move(module_id)) {}

    const std::string& moduleId() const { return module_id_; }

    Diagnostic diagnostic() const {
        return {DiagnosticKind::UnsupportedModule, module_id_, what()};
    }

private:
    std::string module_id_;
};

} // namespace zpdes
