#pragma once

#include "audit.hpp"
#include "ecosystem.hpp"
#include "package_info.hpp"
#include "registry.hpp"
#include "requirement_parser.hpp"

#include <filesystem>
#include <string>
#include <vector>

struct AnalysisReport {
    Ecosystem ecosystem = Ecosystem::PYTHON;
    std::vector<PackageInfo> packages;
    DockerSizeEstimate estimate;
    std::vector<ConflictRecord> conflicts;
};

// Reads and parses one manifest. Throws ManifestNotFound or ParseError.
std::vector<RequirementRecord> load_manifest(const std::filesystem::path& path, Ecosystem eco);

class Analyzer {
public:
    Analyzer(RegistryClient& registry, AuditClient& auditor, int jobs);

    // Throws UnsupportedEcosystem, ManifestNotFound or ParseError; registry
    // and audit failures only degrade the affected package's fields.
    AnalysisReport analyze(const std::vector<std::filesystem::path>& manifests, const std::string& ecosystem_tag);
    AnalysisReport analyze(const std::vector<std::filesystem::path>& manifests, Ecosystem eco);

private:
    RegistryClient& registry_;
    AuditClient& auditor_;
    int jobs_;
};
