#pragma once

#include <cstdint>
#include <string>
#include <string_view>

// Placeholders used when registry or audit data cannot be obtained.
inline constexpr std::string_view NO_DESCRIPTION = "No description available";
inline constexpr std::string_view UNAVAILABLE = "unavailable";
inline constexpr std::string_view NO_AUDIT_AVAILABLE = "No security audit available";

struct PackageInfo {
    std::string name;
    std::uint64_t size = 0;
    bool is_paid = false;
    std::string version;
    std::string description{NO_DESCRIPTION};
    std::string latest_version{UNAVAILABLE};
    std::string vulnerabilities{UNAVAILABLE};
};

struct DockerSizeEstimate {
    std::uint64_t full = 0;
    std::uint64_t slim = 0;
    std::uint64_t alpine = 0;
};

struct ConflictRecord {
    std::string name;
    std::string first_version;
    std::string conflicting_version;

    bool operator==(const ConflictRecord&) const = default;
};
