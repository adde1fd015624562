#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace codebox::environment {

// Decides which dependency specifiers may reach the package manager.
// Accepted: `name`, `name[extra,...]`, optionally followed by comma separated
// version clauses (`==1.0`, `>=2,<3`, `~=1.4`). Anything that pip would read
// as an option, a URL, a VCS reference or a local path is refused, as are
// packages on the block list (compared by normalized name).
class DependencyPolicy {
public:
    DependencyPolicy() = default;
    explicit DependencyPolicy(const std::vector<std::string>& blocked_packages);

    // Throws SecurityError naming the offending specifier.
    void Validate(const std::string& specifier) const;
    void ValidateAll(const std::vector<std::string>& specifiers) const;

    bool IsBlocked(const std::string& name) const;

    // Lower case, runs of '-', '_' and '.' collapsed to a single '-'.
    static std::string NormalizeName(const std::string& name);

    // Distribution name of an accepted specifier ("Requests[socks]>=2" -> "Requests").
    static std::string NameOf(const std::string& specifier);

private:
    std::unordered_set<std::string> blocked_;
};

}  // namespace codebox::environment
