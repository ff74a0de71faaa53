#include "registry_schema.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

using json = nlohmann::json;

namespace {

// Absent, null or mistyped fields all read as "not there".
std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<std::uint64_t> optional_size(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    if (it->is_number_unsigned()) return it->get<std::uint64_t>();
    if (it->is_number_integer()) {
        auto v = it->get<std::int64_t>();
        if (v >= 0) return static_cast<std::uint64_t>(v);
    }
    return std::nullopt;
}

const json& object_or_empty(const json& j, const char* key) {
    static const json empty = json::object();
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) return empty;
    return *it;
}

std::optional<std::uint64_t> first_size_of_type(const std::vector<PypiDistribution>& files, std::string_view type) {
    auto it = std::ranges::find_if(files, [&](const PypiDistribution& d) { return d.packagetype == type; });
    if (it == files.end()) return std::nullopt;
    return it->size.value_or(0);
}

} // anonymous namespace

void from_json(const json& j, PypiDistribution& d) {
    d.packagetype = optional_string(j, "packagetype").value_or("");
    d.size = optional_size(j, "size");
}

void from_json(const json& j, PypiProject& p) {
    const json& info = object_or_empty(j, "info");
    p.version = optional_string(info, "version");
    p.description = optional_string(info, "description");
    p.summary = optional_string(info, "summary");

    p.releases.clear();
    for (const auto& [version, files] : object_or_empty(j, "releases").items()) {
        if (!files.is_array()) continue;
        auto& dists = p.releases[version];
        for (const auto& file : files) {
            if (file.is_object()) dists.push_back(file.get<PypiDistribution>());
        }
    }

    p.urls.clear();
    if (auto it = j.find("urls"); it != j.end() && it->is_array()) {
        for (const auto& file : *it) {
            if (file.is_object()) p.urls.push_back(file.get<PypiDistribution>());
        }
    }
}

void from_json(const json& j, NpmDist& d) {
    d.unpacked_size = optional_size(j, "unpackedSize");
    d.size = optional_size(j, "size");
}

void from_json(const json& j, NpmVersion& v) {
    v.dist = object_or_empty(j, "dist").get<NpmDist>();
}

void from_json(const json& j, NpmPackument& p) {
    p.latest = optional_string(object_or_empty(j, "dist-tags"), "latest");
    p.description = optional_string(j, "description");

    p.versions.clear();
    for (const auto& [version, data] : object_or_empty(j, "versions").items()) {
        if (data.is_object()) p.versions.emplace(version, data.get<NpmVersion>());
    }
}

RegistryMetadata to_metadata(const PypiProject& project) {
    RegistryMetadata meta;
    meta.latest_version = project.version;
    if (project.description && !project.description->empty()) {
        meta.description = project.description;
    } else if (project.summary && !project.summary->empty()) {
        meta.description = project.summary;
    }

    if (!project.version) return meta;

    const std::vector<PypiDistribution>* files = nullptr;
    if (auto it = project.releases.find(*project.version); it != project.releases.end() && !it->second.empty()) {
        files = &it->second;
    } else if (!project.urls.empty()) {
        files = &project.urls;
    }
    if (!files) return meta;

    if (auto wheel = first_size_of_type(*files, "bdist_wheel")) {
        meta.size = *wheel;
    } else if (auto sdist = first_size_of_type(*files, "sdist")) {
        meta.size = *sdist;
    }
    return meta;
}

RegistryMetadata to_metadata(const NpmPackument& packument) {
    RegistryMetadata meta;
    meta.latest_version = packument.latest;
    meta.description = packument.description;

    if (!packument.latest) return meta;
    auto it = packument.versions.find(*packument.latest);
    if (it == packument.versions.end()) return meta;

    const NpmDist& dist = it->second.dist;
    meta.size = dist.unpacked_size.value_or(dist.size.value_or(0));
    return meta;
}

LookupResult<RegistryMetadata> parse_registry_document(Ecosystem eco, std::string_view body) {
    try {
        json doc = json::parse(body);
        if (!doc.is_object()) {
            return LookupResult<RegistryMetadata>::Err(LookupErrorCode::Malformed, "registry response is not a JSON object");
        }
        if (eco == Ecosystem::PYTHON) {
            auto project = doc.get<PypiProject>();
            if (!project.version) {
                return LookupResult<RegistryMetadata>::Err(LookupErrorCode::Malformed, "missing info.version");
            }
            return LookupResult<RegistryMetadata>::Ok(to_metadata(project));
        }
        return LookupResult<RegistryMetadata>::Ok(to_metadata(doc.get<NpmPackument>()));
    } catch (const json::exception& e) {
        return LookupResult<RegistryMetadata>::Err(LookupErrorCode::Malformed, e.what());
    }
}
