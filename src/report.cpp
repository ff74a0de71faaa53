#include "report.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <iomanip>
#include <string>

using json = nlohmann::ordered_json;

json report_to_json(const AnalysisReport& report) {
    json packages = json::array();
    for (const auto& pkg : report.packages) {
        packages.push_back({
            {"name", pkg.name},
            {"size", pkg.size},
            {"is_paid", pkg.is_paid},
            {"version", pkg.version},
            {"description", pkg.description},
            {"latest_version", pkg.latest_version},
            {"vulnerabilities", pkg.vulnerabilities},
        });
    }

    json conflicts = json::array();
    for (const auto& conflict : report.conflicts) {
        conflicts.push_back({
            {"name", conflict.name},
            {"first_version", conflict.first_version},
            {"conflicting_version", conflict.conflicting_version},
        });
    }

    json doc;
    doc["ecosystem"] = ecosystem_name(report.ecosystem);
    doc["packages"] = std::move(packages);
    doc["docker_sizes"] = {
        {"full", report.estimate.full},
        {"slim", report.estimate.slim},
        {"alpine", report.estimate.alpine},
    };
    doc["conflicts"] = std::move(conflicts);
    return doc;
}

void write_report(const AnalysisReport& report, const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        ensure_dir_exists(path.parent_path());
    }
    write_string_to_file(path, report_to_json(report).dump(4) + "\n");
}

void print_summary(const AnalysisReport& report, std::ostream& out) {
    const std::string name_header = get_string("table.name");
    const std::string size_header = get_string("table.size");
    const std::string paid_header = get_string("table.is_paid");
    const std::string yes = get_string("table.yes");
    const std::string no = get_string("table.no");

    size_t name_width = name_header.size();
    size_t size_width = size_header.size();
    size_t paid_width = std::max({paid_header.size(), yes.size(), no.size()});
    for (const auto& pkg : report.packages) {
        name_width = std::max(name_width, pkg.name.size());
        size_width = std::max(size_width, std::to_string(pkg.size).size());
    }

    out << "\n" << get_string("info.dependency_overview") << "\n";
    if (report.packages.empty()) {
        out << get_string("info.no_packages") << "\n";
    } else {
        out << std::right
            << std::setw(static_cast<int>(name_width)) << name_header << " "
            << std::setw(static_cast<int>(size_width)) << size_header << " "
            << std::setw(static_cast<int>(paid_width)) << paid_header << "\n";
        for (const auto& pkg : report.packages) {
            out << std::setw(static_cast<int>(name_width)) << pkg.name << " "
                << std::setw(static_cast<int>(size_width)) << pkg.size << " "
                << std::setw(static_cast<int>(paid_width)) << (pkg.is_paid ? yes : no) << "\n";
        }
    }

    out << "\n" << string_format("info.docker_sizes", report.estimate.full, report.estimate.slim, report.estimate.alpine) << "\n";

    if (report.conflicts.empty()) {
        out << "\n" << get_string("info.no_conflicts") << "\n";
    } else {
        out << "\n" << get_string("info.conflicts_detected") << "\n";
        for (const auto& conflict : report.conflicts) {
            out << string_format("info.conflict_line", conflict.name, conflict.first_version, conflict.conflicting_version) << "\n";
        }
    }
}
