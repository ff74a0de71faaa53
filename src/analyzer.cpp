#include "analyzer.hpp"
#include "conflict.hpp"
#include "exception.hpp"
#include "image_estimator.hpp"
#include "localization.hpp"
#include "metadata_cache.hpp"
#include "resolver.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

std::vector<RequirementRecord> load_manifest(const fs::path& path, Ecosystem eco) {
    if (!fs::exists(path)) {
        throw ManifestNotFound(string_format("error.manifest_not_found", path.string()));
    }
    const std::string content = read_file_to_string(path);
    try {
        return parse_requirements(content, eco);
    } catch (const ParseError& e) {
        throw ParseError(path.string() + ": " + e.what());
    }
}

Analyzer::Analyzer(RegistryClient& registry, AuditClient& auditor, int jobs)
    : registry_(registry), auditor_(auditor), jobs_(jobs) {}

AnalysisReport Analyzer::analyze(const std::vector<fs::path>& manifests, const std::string& ecosystem_tag) {
    return analyze(manifests, parse_ecosystem(ecosystem_tag));
}

AnalysisReport Analyzer::analyze(const std::vector<fs::path>& manifests, Ecosystem eco) {
    // Fail on a missing manifest before any registry traffic.
    for (const auto& path : manifests) {
        if (!fs::exists(path)) {
            throw ManifestNotFound(string_format("error.manifest_not_found", path.string()));
        }
    }

    std::vector<RequirementRecord> requirements;
    for (const auto& path : manifests) {
        auto records = load_manifest(path, eco);
        log_info(string_format("info.manifest_parsed", path.string(), records.size()));
        requirements.insert(requirements.end(),
                            std::make_move_iterator(records.begin()),
                            std::make_move_iterator(records.end()));
    }

    log_info(string_format("info.resolving_packages", requirements.size(), ecosystem_name(eco)));

    MetadataCache cache;
    RegistryResolver resolver(registry_, auditor_, cache);

    AnalysisReport report;
    report.ecosystem = eco;
    report.packages = resolver.resolve_all(requirements, eco, jobs_);
    report.conflicts = find_conflicts(report.packages);
    report.estimate = estimate_image_sizes(report.packages, eco);
    return report;
}
