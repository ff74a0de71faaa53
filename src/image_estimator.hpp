#pragma once

#include "ecosystem.hpp"
#include "package_info.hpp"

#include <cstdint>
#include <vector>

// Share of the summed package size added for layer and install overhead, in percent.
inline constexpr std::uint64_t IMAGE_OVERHEAD_PERCENT = 15;

// base + total + floor(total * 0.15) for each of the full, slim and alpine variants.
DockerSizeEstimate estimate_image_sizes(const std::vector<PackageInfo>& packages, Ecosystem eco);
