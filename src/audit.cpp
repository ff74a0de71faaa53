#include "audit.hpp"
#include "config.hpp"
#include "localization.hpp"
#include "package_info.hpp"
#include "utils.hpp"

namespace {
// Shell convention for "command not found" after a failed exec.
constexpr int EXIT_COMMAND_NOT_FOUND = 127;
}

LookupResult<std::string> CommandAuditClient::audit(Ecosystem eco, const std::string& pkg_name) {
    const auto args = get_audit_command(eco, pkg_name);
    if (args.empty()) {
        return LookupResult<std::string>::Ok(std::string(NO_AUDIT_AVAILABLE));
    }

    auto output = run_command_capture(args);
    if (!output) {
        return LookupResult<std::string>::Err(LookupErrorCode::ProcessFailed, string_format("error.audit_failed", args[0], pkg_name));
    }
    if (output->exit_code == EXIT_COMMAND_NOT_FOUND) {
        return LookupResult<std::string>::Err(LookupErrorCode::ProcessFailed, string_format("error.audit_not_found", args[0]));
    }
    // Audit tools exit non-zero when they find something; the report is still on stdout.
    return LookupResult<std::string>::Ok(trim(output->stdout_text));
}

LookupResult<std::string> DisabledAuditClient::audit(Ecosystem, const std::string&) {
    return LookupResult<std::string>::Ok(std::string(NO_AUDIT_AVAILABLE));
}
