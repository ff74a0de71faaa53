#include <gtest/gtest.h>
#include "../src/image_estimator.hpp"

namespace {
constexpr std::uint64_t MiB = 1024 * 1024;

std::vector<PackageInfo> with_sizes(std::initializer_list<std::uint64_t> sizes) {
    std::vector<PackageInfo> packages;
    for (auto size : sizes) {
        PackageInfo info;
        info.name = "p" + std::to_string(packages.size());
        info.size = size;
        packages.push_back(info);
    }
    return packages;
}
}

TEST(ImageEstimatorTest, PythonBaseSizes) {
    auto packages = with_sizes({1000, 2333, 667});
    const std::uint64_t total = 4000;
    auto estimate = estimate_image_sizes(packages, Ecosystem::PYTHON);

    EXPECT_EQ(estimate.full - estimate.slim, 60 * MiB);
    EXPECT_EQ(estimate.full, 100 * MiB + total + 600);
    EXPECT_EQ(estimate.slim, 40 * MiB + total + 600);
    EXPECT_EQ(estimate.alpine, 15 * MiB + total + 600);
}

TEST(ImageEstimatorTest, NodeBaseSizes) {
    auto estimate = estimate_image_sizes({}, Ecosystem::NODE);
    EXPECT_EQ(estimate.full, 85 * MiB);
    EXPECT_EQ(estimate.slim, 35 * MiB);
    EXPECT_EQ(estimate.alpine, 12 * MiB);
}

TEST(ImageEstimatorTest, OverheadIsFloored) {
    // 0.15 * 7 = 1.05, 0.15 * 13 = 1.95, 0.15 * 101 = 15.15
    EXPECT_EQ(estimate_image_sizes(with_sizes({7}), Ecosystem::PYTHON).full, 100 * MiB + 7 + 1);
    EXPECT_EQ(estimate_image_sizes(with_sizes({13}), Ecosystem::PYTHON).full, 100 * MiB + 13 + 1);
    EXPECT_EQ(estimate_image_sizes(with_sizes({101}), Ecosystem::PYTHON).full, 100 * MiB + 101 + 15);
}

TEST(ImageEstimatorTest, LargeTotalsStayExact) {
    const std::uint64_t big = 123456789012345ULL;
    auto estimate = estimate_image_sizes(with_sizes({big}), Ecosystem::NODE);
    // floor(123456789012345 * 0.15) = 18518518351851
    EXPECT_EQ(estimate.full, 85 * MiB + big + 18518518351851ULL);
}

TEST(ImageEstimatorTest, NeverBelowBase) {
    auto estimate = estimate_image_sizes(with_sizes({0, 0}), Ecosystem::PYTHON);
    EXPECT_GE(estimate.full, 100 * MiB);
    EXPECT_GE(estimate.slim, 40 * MiB);
    EXPECT_GE(estimate.alpine, 15 * MiB);
}
