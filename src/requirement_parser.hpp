#pragma once

#include "ecosystem.hpp"

#include <string>
#include <string_view>
#include <vector>

struct RequirementRecord {
    std::string name;               // normalized registry identity, never empty
    std::string version_constraint; // bare version, empty if unspecified
};

// Splits a manifest into requirement records in declaration order.
// Throws ParseError when a node manifest is not a well-formed package.json.
std::vector<RequirementRecord> parse_requirements(std::string_view content, Ecosystem eco);

std::vector<RequirementRecord> parse_python_requirements(std::string_view content);
std::vector<RequirementRecord> parse_node_manifest(std::string_view content);
