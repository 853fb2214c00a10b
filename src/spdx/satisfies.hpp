// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <optional>
#include <ostream>

#include "lattice/lattice_syntax.hpp"
#include "spdx/expression.hpp"
#include "spdx/ranges.hpp"

namespace licsat {

/// Lattice variable for licenses: a license identity together with its exception, if any.
struct Lic {
    LicenseIdentity license;
    std::optional<LicenseExceptionId> exception;

    bool operator==(const Lic&) const = default;
};

std::ostream& operator<<(std::ostream& os, const Lic& lic);

// Conjunction becomes meet and disjunction becomes join. "id+" becomes the join of every license in
// the range of id. A reference with '+' stays a single variable since its later versions are unknown,
// so "LicenseRef-x+" and "LicenseRef-x" translate to the same variable.
LatticeSyntax<Lic> to_lattice(const LicenseExpression& expr, const LicenseRangeLookup& lookup);
LatticeSyntax<Lic> to_lattice(const LicenseExpression& expr);

// Does a package with license `package` satisfy the license policy `policy`?
//
// satisfies(package, policy) iff policy <= package.
bool satisfies(const LicenseExpression& package, const LicenseExpression& policy, const LicenseRangeLookup& lookup);
bool satisfies(const LicenseExpression& package, const LicenseExpression& policy);

} // namespace licsat
