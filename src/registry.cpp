#include "registry.hpp"
#include "config.hpp"
#include "downloader.hpp"
#include "localization.hpp"

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

HttpRegistryClient::HttpRegistryClient(long timeout_seconds, int max_retries)
    : timeout_seconds_(timeout_seconds), max_retries_(max_retries) {}

std::string HttpRegistryClient::document_url(Ecosystem eco, const std::string& pkg_name) {
    const std::string base = get_registry_url(eco);
    if (eco == Ecosystem::PYTHON) {
        return base + "/pypi/" + escape_url_component(pkg_name) + "/json";
    }
    // Scoped npm packages (@scope/name) are one path segment with the slash escaped.
    if (!pkg_name.empty() && pkg_name[0] == '@') {
        return base + "/@" + escape_url_component(pkg_name.substr(1));
    }
    return base + "/" + escape_url_component(pkg_name);
}

LookupResult<RegistryMetadata> HttpRegistryClient::fetch(Ecosystem eco, const std::string& pkg_name) {
    auto body = fetch_with_retries(document_url(eco, pkg_name), timeout_seconds_, max_retries_);
    if (!body) {
        return {std::nullopt, body.error};
    }
    return parse_registry_document(eco, *body.value);
}

LocalRegistryClient::LocalRegistryClient(fs::path root) : root_(std::move(root)) {}

LookupResult<RegistryMetadata> LocalRegistryClient::fetch(Ecosystem eco, const std::string& pkg_name) {
    // The document must stay inside <root>/<ecosystem>.
    const fs::path eco_dir = (root_ / ecosystem_name(eco)).lexically_normal();
    const fs::path doc_path = (eco_dir / (pkg_name + ".json")).lexically_normal();
    const fs::path inside = doc_path.lexically_relative(eco_dir);
    if (pkg_name.empty() || fs::path(pkg_name).has_root_path() || inside.empty() || *inside.begin() == "..") {
        return LookupResult<RegistryMetadata>::Err(LookupErrorCode::NotFound, string_format("error.invalid_package_name", pkg_name));
    }

    std::ifstream file(doc_path, std::ios::binary);
    if (!file.is_open()) {
        return LookupResult<RegistryMetadata>::Err(LookupErrorCode::NotFound, string_format("error.open_file_failed", doc_path.string()));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return parse_registry_document(eco, ss.str());
}
