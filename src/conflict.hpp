#pragma once

#include "package_info.hpp"

#include <vector>

// Reports every occurrence whose version differs from the first version seen for
// the same name. Three distinct versions of one package give two records.
std::vector<ConflictRecord> find_conflicts(const std::vector<PackageInfo>& packages);
