#pragma once

#include "ecosystem.hpp"
#include "lookup_result.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// What the resolver needs from one registry document.
struct RegistryMetadata {
    std::uint64_t size = 0;
    std::optional<std::string> description;
    std::optional<std::string> latest_version;
};

// PyPI JSON API: GET /pypi/<name>/json
struct PypiDistribution {
    std::string packagetype;           // "bdist_wheel", "sdist", ...
    std::optional<std::uint64_t> size;
};

struct PypiProject {
    std::optional<std::string> version;     // info.version, the latest release
    std::optional<std::string> description; // info.description
    std::optional<std::string> summary;     // info.summary
    std::map<std::string, std::vector<PypiDistribution>> releases;
    std::vector<PypiDistribution> urls;     // files of the latest release
};

// npm registry packument: GET /<name>
struct NpmDist {
    std::optional<std::uint64_t> unpacked_size;
    std::optional<std::uint64_t> size;
};

struct NpmVersion {
    NpmDist dist;
};

struct NpmPackument {
    std::optional<std::string> latest;      // dist-tags.latest
    std::optional<std::string> description;
    std::map<std::string, NpmVersion> versions;
};

void from_json(const nlohmann::json& j, PypiDistribution& d);
void from_json(const nlohmann::json& j, PypiProject& p);
void from_json(const nlohmann::json& j, NpmDist& d);
void from_json(const nlohmann::json& j, NpmVersion& v);
void from_json(const nlohmann::json& j, NpmPackument& p);

// Wheel size if any wheel exists, else sdist size, else 0.
RegistryMetadata to_metadata(const PypiProject& project);
// dist.unpackedSize of the latest tag, else dist.size, else 0.
RegistryMetadata to_metadata(const NpmPackument& packument);

// Decodes a raw registry response body for the given ecosystem.
LookupResult<RegistryMetadata> parse_registry_document(Ecosystem eco, std::string_view body);
