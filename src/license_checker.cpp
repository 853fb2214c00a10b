// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#include <iostream>

#include "license_checker.hpp"
#include "utils/debug.hpp"

namespace licsat {

static LicenseRangeLookup range_lookup(const licsat_options_t& options) {
    if (options.expand_ranges) {
        return lookup_license_range;
    }
    return [](const LicenseId& id) { return std::vector<LicenseId>{id}; };
}

CheckReport check_satisfies(const LicenseExpression& package, const LicenseExpression& policy,
                            const licsat_options_t& options) {
    const LicenseRangeLookup lookup = range_lookup(options);
    BruteForce<Lic> search;
    CheckReport report{
        .holds = false,
        .lhs = to_lattice(policy, lookup),
        .rhs = to_lattice(package, lookup),
        .stats = {},
    };
    report.holds = search.preorder(report.lhs, report.rhs);
    report.stats = search.stats();
    LICSAT_LOG("check", std::cout << "satisfies(" << package << ", " << policy << ") = " << report.holds << "\n");
    return report;
}

CheckReport check_equivalent(const LicenseExpression& a, const LicenseExpression& b, const licsat_options_t& options) {
    const LicenseRangeLookup lookup = range_lookup(options);
    BruteForce<Lic> search;
    CheckReport report{
        .holds = false,
        .lhs = to_lattice(a, lookup),
        .rhs = to_lattice(b, lookup),
        .stats = {},
    };
    report.holds = search.equivalent(report.lhs, report.rhs);
    report.stats = search.stats();
    LICSAT_LOG("check", std::cout << "equivalent(" << a << ", " << b << ") = " << report.holds << "\n");
    return report;
}

void print_report(std::ostream& os, const CheckReport& report, const verbosity_options_t& verbosity) {
    if (verbosity.print_formulas) {
        os << "lhs: " << report.lhs << "\n";
        os << "rhs: " << report.rhs << "\n";
    }
    if (verbosity.print_stats) {
        os << "stats: " << report.stats << "\n";
    }
    os << report.holds << "\n";
}

} // namespace licsat
