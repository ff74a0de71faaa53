#include "ecosystem.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace {

constexpr std::uint64_t MiB = 1024 * 1024;

constexpr std::array<std::string_view, 2> PYTHON_PAID = {"private-package", "enterprise-pkg"};
constexpr std::array<std::string_view, 2> NODE_PAID = {"private-module", "enterprise-pkg"};

} // anonymous namespace

Ecosystem parse_ecosystem(std::string_view tag) {
    if (tag == "python") return Ecosystem::PYTHON;
    if (tag == "node") return Ecosystem::NODE;
    throw UnsupportedEcosystem(string_format("error.unsupported_ecosystem", std::string(tag)));
}

std::string ecosystem_name(Ecosystem eco) {
    return eco == Ecosystem::PYTHON ? "python" : "node";
}

std::string normalize_package_name(std::string_view name, Ecosystem eco) {
    if (eco == Ecosystem::NODE) return std::string(name);

    std::string result;
    result.reserve(name.size());
    bool in_separator = false;
    for (char c : name) {
        if (c == '-' || c == '_' || c == '.') {
            if (!in_separator) result += '-';
            in_separator = true;
        } else {
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            in_separator = false;
        }
    }
    return result;
}

BaseImageSizes get_base_image_sizes(Ecosystem eco) {
    switch (eco) {
        case Ecosystem::PYTHON:
            return {100 * MiB, 40 * MiB, 15 * MiB};
        case Ecosystem::NODE:
        default:
            return {85 * MiB, 35 * MiB, 12 * MiB};
    }
}

bool is_paid_package(std::string_view name, Ecosystem eco) {
    const auto& builtin = (eco == Ecosystem::PYTHON) ? PYTHON_PAID : NODE_PAID;
    if (std::ranges::find(builtin, name) != builtin.end()) return true;
    const auto& extra = get_extra_paid_packages(eco);
    return std::ranges::find(extra, name) != extra.end();
}
