#include "environment/dependency_policy.hpp"

#include <cctype>
#include <regex>

#include "core/errors.hpp"
#include "utils/common.hpp"

namespace codebox::environment {
namespace {

// '<' and '>' are version operators and never reach a shell.
constexpr const char* kShellMetacharacters = ";|&$`(){}'\"\\";

const std::regex& SpecifierPattern() {
    static const std::regex pattern(
        R"(^([A-Za-z0-9]|[A-Za-z0-9][A-Za-z0-9._-]*[A-Za-z0-9])(\[[A-Za-z0-9._-]+(,[A-Za-z0-9._-]+)*\])?)"
        R"(((===|==|!=|~=|>=|<=|>|<)[A-Za-z0-9._+*-]+(,(===|==|!=|~=|>=|<=|>|<)[A-Za-z0-9._+*-]+)*)?$)");
    return pattern;
}

void Reject(const std::string& specifier, const std::string& reason) {
    throw SecurityError("Dependency '" + specifier + "' rejected: " + reason);
}

}  // namespace

DependencyPolicy::DependencyPolicy(const std::vector<std::string>& blocked_packages) {
    for (const auto& name : blocked_packages) {
        const auto trimmed = utils::Trim(name);
        if (!trimmed.empty()) {
            blocked_.insert(NormalizeName(trimmed));
        }
    }
}

void DependencyPolicy::Validate(const std::string& specifier) const {
    if (specifier.empty()) {
        Reject(specifier, "empty specifier");
    }
    if (specifier.front() == '-') {
        Reject(specifier, "package manager options are not allowed");
    }
    for (const char ch : specifier) {
        if (std::isspace(static_cast<unsigned char>(ch)) || std::iscntrl(static_cast<unsigned char>(ch))) {
            Reject(specifier, "whitespace or control characters");
        }
    }
    if (specifier.find_first_of(kShellMetacharacters) != std::string::npos) {
        Reject(specifier, "shell metacharacters");
    }
    if (specifier.find("://") != std::string::npos || specifier.rfind("git+", 0) == 0 ||
        specifier.find('@') != std::string::npos) {
        Reject(specifier, "direct URL and VCS references are not allowed");
    }
    if (specifier.front() == '.' || specifier.find('/') != std::string::npos) {
        Reject(specifier, "local paths are not allowed");
    }
    if (!std::regex_match(specifier, SpecifierPattern())) {
        Reject(specifier, "not a package specifier");
    }
    if (IsBlocked(NameOf(specifier))) {
        Reject(specifier, "package is blocked");
    }
}

void DependencyPolicy::ValidateAll(const std::vector<std::string>& specifiers) const {
    for (const auto& specifier : specifiers) {
        Validate(specifier);
    }
}

bool DependencyPolicy::IsBlocked(const std::string& name) const {
    return blocked_.count(NormalizeName(name)) > 0;
}

std::string DependencyPolicy::NormalizeName(const std::string& name) {
    std::string normalized;
    normalized.reserve(name.size());
    bool in_separator = false;
    for (const char ch : name) {
        if (ch == '-' || ch == '_' || ch == '.') {
            if (!in_separator) {
                normalized.push_back('-');
            }
            in_separator = true;
            continue;
        }
        in_separator = false;
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return normalized;
}

std::string DependencyPolicy::NameOf(const std::string& specifier) {
    const auto end = specifier.find_first_of("[=!~<>,");
    return specifier.substr(0, end);
}

}  // namespace codebox::environment
