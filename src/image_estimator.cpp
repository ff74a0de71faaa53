#include "image_estimator.hpp"

DockerSizeEstimate estimate_image_sizes(const std::vector<PackageInfo>& packages, Ecosystem eco) {
    std::uint64_t total = 0;
    for (const auto& pkg : packages) {
        total += pkg.size;
    }
    // Integer form of floor(total * 0.15), exact for every total.
    const std::uint64_t overhead = total / 100 * IMAGE_OVERHEAD_PERCENT + total % 100 * IMAGE_OVERHEAD_PERCENT / 100;
    const std::uint64_t added = total + overhead;

    const BaseImageSizes base = get_base_image_sizes(eco);
    return DockerSizeEstimate{
        base.full + added,
        base.slim + added,
        base.alpine + added,
    };
}
