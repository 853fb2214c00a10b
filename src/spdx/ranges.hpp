// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <functional>
#include <vector>

#include "spdx/license_id.hpp"

namespace licsat {

// Version families of a license, oldest first.
const std::vector<std::vector<LicenseId>>& license_ranges();

/// Licenses that "id or later" stands for: the family members from id onward, or just id if it
/// belongs to no family.
std::vector<LicenseId> lookup_license_range(const LicenseId& id);

// Range table used when translating "id+" terms. May return an empty list.
using LicenseRangeLookup = std::function<std::vector<LicenseId>(const LicenseId&)>;

} // namespace licsat
