#pragma once

#include "ecosystem.hpp"
#include "lookup_result.hpp"
#include "registry_schema.hpp"

#include <filesystem>
#include <string>

// Source of latest-version metadata for a package. Implementations must be
// safe to call from several resolver threads at once.
class RegistryClient {
public:
    virtual ~RegistryClient() = default;
    virtual LookupResult<RegistryMetadata> fetch(Ecosystem eco, const std::string& pkg_name) = 0;
};

// Talks to pypi.org / registry.npmjs.org (or the mirrors set in depsize.conf).
class HttpRegistryClient : public RegistryClient {
public:
    HttpRegistryClient(long timeout_seconds, int max_retries);
    LookupResult<RegistryMetadata> fetch(Ecosystem eco, const std::string& pkg_name) override;

    static std::string document_url(Ecosystem eco, const std::string& pkg_name);

private:
    long timeout_seconds_;
    int max_retries_;
};

// Offline mirror laid out as <root>/<python|node>/<name>.json, each file holding
// the registry's JSON document for that package.
class LocalRegistryClient : public RegistryClient {
public:
    explicit LocalRegistryClient(std::filesystem::path root);
    LookupResult<RegistryMetadata> fetch(Ecosystem eco, const std::string& pkg_name) override;

private:
    std::filesystem::path root_;
};
