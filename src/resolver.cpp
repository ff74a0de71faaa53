#include "resolver.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>

RegistryResolver::RegistryResolver(RegistryClient& registry, AuditClient& auditor, MetadataCache& cache)
    : registry_(registry), auditor_(auditor), cache_(cache) {}

PackageInfo RegistryResolver::resolve(const RequirementRecord& requirement, Ecosystem eco) {
    PackageInfo info;
    info.name = requirement.name;
    info.version = requirement.version_constraint;
    info.is_paid = is_paid_package(requirement.name, eco);

    auto metadata = cache_.get_or_fetch(eco, requirement.name, [&] {
        return registry_.fetch(eco, requirement.name);
    });
    if (metadata) {
        info.size = metadata.value->size;
        if (metadata.value->description) info.description = *metadata.value->description;
        if (metadata.value->latest_version) info.latest_version = *metadata.value->latest_version;
    } else if (metadata.error) {
        log_warning(string_format("warning.registry_lookup_failed", requirement.name,
                                  lookup_error_name(metadata.error->code), metadata.error->message));
    }

    auto audit = auditor_.audit(eco, requirement.name);
    if (audit) {
        info.vulnerabilities = std::move(*audit.value);
    } else if (audit.error) {
        log_warning(string_format("warning.audit_failed", requirement.name, audit.error->message));
    }

    return info;
}

std::vector<PackageInfo> RegistryResolver::resolve_all(const std::vector<RequirementRecord>& requirements, Ecosystem eco, int jobs) {
    std::vector<PackageInfo> results(requirements.size());
    if (requirements.empty()) return results;

    const size_t total = requirements.size();
    const size_t worker_count = std::min(total, static_cast<size_t>(std::max(1, jobs)));
    std::atomic<size_t> next_index{0};
    std::atomic<size_t> done_count{0};

    auto worker = [&] {
        while (true) {
            const size_t i = next_index.fetch_add(1);
            if (i >= total) return;
            results[i] = resolve(requirements[i], eco);
            const size_t done = ++done_count;
            log_progress(get_string("info.resolving"), static_cast<double>(done) * 100.0 / static_cast<double>(total));
        }
    };

    std::vector<std::future<void>> futures;
    futures.reserve(worker_count);
    for (size_t w = 0; w < worker_count; ++w) {
        futures.push_back(std::async(std::launch::async, worker));
    }

    // Every worker must finish before `results` goes out of scope, even if one failed.
    std::exception_ptr first_error;
    for (auto& fut : futures) {
        try {
            fut.get();
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    end_progress();
    if (first_error) std::rethrow_exception(first_error);

    return results;
}
