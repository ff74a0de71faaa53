#pragma once

#include "audit.hpp"
#include "ecosystem.hpp"
#include "metadata_cache.hpp"
#include "package_info.hpp"
#include "registry.hpp"
#include "requirement_parser.hpp"

#include <vector>

class RegistryResolver {
public:
    RegistryResolver(RegistryClient& registry, AuditClient& auditor, MetadataCache& cache);

    // Never throws for lookup failures: missing data becomes placeholder values.
    PackageInfo resolve(const RequirementRecord& requirement, Ecosystem eco);

    // Resolves on up to `jobs` worker threads. The result is in the order of `requirements`.
    std::vector<PackageInfo> resolve_all(const std::vector<RequirementRecord>& requirements, Ecosystem eco, int jobs);

private:
    RegistryClient& registry_;
    AuditClient& auditor_;
    MetadataCache& cache_;
};
