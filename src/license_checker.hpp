// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <ostream>

#include "config.hpp"
#include "lattice/brute_force.hpp"
#include "spdx/satisfies.hpp"

namespace licsat {

struct CheckReport {
    bool holds{};
    LatticeSyntax<Lic> lhs; ///< Left operand of the lattice comparison.
    LatticeSyntax<Lic> rhs; ///< Right operand of the lattice comparison.
    SearchStats stats;
};

/// satisfies(package, policy), with the translated formulas and search statistics.
CheckReport check_satisfies(const LicenseExpression& package, const LicenseExpression& policy,
                            const licsat_options_t& options = {});

/// Semantic equivalence of two license expressions.
CheckReport check_equivalent(const LicenseExpression& a, const LicenseExpression& b,
                             const licsat_options_t& options = {});

void print_report(std::ostream& os, const CheckReport& report, const verbosity_options_t& verbosity);

} // namespace licsat
