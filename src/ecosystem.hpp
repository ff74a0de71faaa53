#pragma once

#include <cstdint>
#include <string>
#include <string_view>

enum class Ecosystem {
    PYTHON,
    NODE
};

// Throws UnsupportedEcosystem for anything other than "python" or "node".
Ecosystem parse_ecosystem(std::string_view tag);
std::string ecosystem_name(Ecosystem eco);

// Registry identity of a package name. Python names follow PEP 503
// (lowercase, runs of "-", "_" and "." become a single "-"); node names are kept as declared.
std::string normalize_package_name(std::string_view name, Ecosystem eco);

struct BaseImageSizes {
    std::uint64_t full;
    std::uint64_t slim;
    std::uint64_t alpine;
};

BaseImageSizes get_base_image_sizes(Ecosystem eco);

bool is_paid_package(std::string_view name, Ecosystem eco);
