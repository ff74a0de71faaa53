#include "conflict.hpp"

#include <string>
#include <unordered_map>

std::vector<ConflictRecord> find_conflicts(const std::vector<PackageInfo>& packages) {
    std::unordered_map<std::string, std::string> first_seen;
    std::vector<ConflictRecord> conflicts;
    for (const auto& pkg : packages) {
        auto [it, inserted] = first_seen.try_emplace(pkg.name, pkg.version);
        // An unspecified version against a pinned one counts as a conflict too.
        if (!inserted && it->second != pkg.version) {
            conflicts.push_back({pkg.name, it->second, pkg.version});
        }
    }
    return conflicts;
}
