#include "requirement_parser.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <regex>
#include <sstream>
#include <unordered_map>

using json = nlohmann::ordered_json;

namespace {

// name, optional [extras], optional comparator + version. Anything after the match is ignored.
const std::regex& requirement_regex() {
    static const std::regex re(R"(^([A-Za-z0-9\-._]+)\s*(?:\[[^\]]*\])?\s*(?:[=<>!~]+\s*([A-Za-z0-9\-._*+]+))?)");
    return re;
}

std::string strip_range_prefix(const std::string& version) {
    static const std::regex prefix_re("^[^0-9]*");
    return std::regex_replace(version, prefix_re, "", std::regex_constants::format_first_only);
}

void merge_dependency_map(const json& manifest, const char* key,
                          std::vector<RequirementRecord>& records,
                          std::unordered_map<std::string, size_t>& index) {
    auto it = manifest.find(key);
    if (it == manifest.end() || it->is_null()) return;
    if (!it->is_object()) {
        throw ParseError(string_format("error.manifest_field_not_object", key));
    }
    for (const auto& [name, version] : it->items()) {
        if (!version.is_string()) {
            throw ParseError(string_format("error.manifest_version_not_string", name));
        }
        if (name.empty()) continue;
        std::string clean_version = strip_range_prefix(version.get<std::string>());
        if (auto found = index.find(name); found != index.end()) {
            records[found->second].version_constraint = std::move(clean_version);
        } else {
            index.emplace(name, records.size());
            records.push_back({normalize_package_name(name, Ecosystem::NODE), std::move(clean_version)});
        }
    }
}

} // anonymous namespace

std::vector<RequirementRecord> parse_requirements(std::string_view content, Ecosystem eco) {
    switch (eco) {
        case Ecosystem::PYTHON:
            return parse_python_requirements(content);
        case Ecosystem::NODE:
        default:
            return parse_node_manifest(content);
    }
}

std::vector<RequirementRecord> parse_python_requirements(std::string_view content) {
    std::vector<RequirementRecord> records;
    std::istringstream stream{std::string(content)};
    std::string raw;
    while (std::getline(stream, raw)) {
        const std::string line = trim(raw);
        // Blank lines, comments and pip options (-r, -e, --index-url ...)
        if (line.empty() || line[0] == '#' || line[0] == '-') continue;

        std::smatch match;
        if (!std::regex_search(line, match, requirement_regex())) continue;

        RequirementRecord record;
        record.name = normalize_package_name(match[1].str(), Ecosystem::PYTHON);
        record.version_constraint = match[2].matched ? match[2].str() : "";
        if (record.name.empty()) continue;
        records.push_back(std::move(record));
    }
    return records;
}

std::vector<RequirementRecord> parse_node_manifest(std::string_view content) {
    json manifest;
    try {
        manifest = json::parse(content);
    } catch (const json::parse_error& e) {
        throw ParseError(string_format("error.invalid_package_json", e.what()));
    }
    if (!manifest.is_object()) {
        throw ParseError(get_string("error.package_json_not_object"));
    }

    std::vector<RequirementRecord> records;
    std::unordered_map<std::string, size_t> index;
    merge_dependency_map(manifest, "dependencies", records, index);
    merge_dependency_map(manifest, "devDependencies", records, index);
    return records;
}
