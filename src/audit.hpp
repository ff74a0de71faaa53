#pragma once

#include "ecosystem.hpp"
#include "lookup_result.hpp"

#include <string>

// Security signal for one package: free text from an external audit tool.
class AuditClient {
public:
    virtual ~AuditClient() = default;
    virtual LookupResult<std::string> audit(Ecosystem eco, const std::string& pkg_name) = 0;
};

// Runs the configured audit command (safety / npm audit) and returns its trimmed stdout.
class CommandAuditClient : public AuditClient {
public:
    LookupResult<std::string> audit(Ecosystem eco, const std::string& pkg_name) override;
};

class DisabledAuditClient : public AuditClient {
public:
    LookupResult<std::string> audit(Ecosystem eco, const std::string& pkg_name) override;
};
