// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#include <iostream>

#include "lattice/brute_force.hpp"
#include "spdx/satisfies.hpp"
#include "utils/debug.hpp"

namespace licsat {

std::ostream& operator<<(std::ostream& os, const Lic& lic) {
    os << to_string(lic.license);
    if (lic.exception) {
        os << " WITH " << *lic.exception;
    }
    return os;
}

// Same shape as the expression, with the simple licenses still unexpanded.
static LatticeSyntax<SimpleLicense> to_syntax(const LicenseExpression& expr) {
    struct SyntaxVisitor {
        LatticeSyntax<SimpleLicense> operator()(const SimpleLicense& s) const {
            return LatticeSyntax<SimpleLicense>::var(s);
        }
        LatticeSyntax<SimpleLicense> operator()(const EConjunction& c) const {
            return LatticeSyntax<SimpleLicense>::meet(to_syntax(*c.left), to_syntax(*c.right));
        }
        LatticeSyntax<SimpleLicense> operator()(const EDisjunction& d) const {
            return LatticeSyntax<SimpleLicense>::join(to_syntax(*d.left), to_syntax(*d.right));
        }
    };
    return std::visit(SyntaxVisitor{}, expr.node());
}

static LatticeSyntax<Lic> expand(const SimpleLicense& s, const LicenseRangeLookup& lookup) {
    const auto id = std::get_if<LicenseId>(&s.license);
    if (!s.or_later || !id) {
        return LatticeSyntax<Lic>::var(Lic{s.license, s.exception});
    }
    const std::vector<LicenseId> range = lookup(*id);
    if (range.empty()) {
        LICSAT_WARN("license range of ", *id, " is empty; treating ", s, " as unsatisfiable");
        return LatticeSyntax<Lic>::bottom();
    }
    auto res = LatticeSyntax<Lic>::var(Lic{range.front(), s.exception});
    for (size_t i = 1; i < range.size(); i++) {
        res = res | LatticeSyntax<Lic>::var(Lic{range[i], s.exception});
    }
    return res;
}

LatticeSyntax<Lic> to_lattice(const LicenseExpression& expr, const LicenseRangeLookup& lookup) {
    LatticeSyntax<Lic> res = substitute(to_syntax(expr), [&](const SimpleLicense& s) { return expand(s, lookup); });
    LICSAT_LOG("translate", std::cout << expr << " => " << res << "\n");
    return res;
}

LatticeSyntax<Lic> to_lattice(const LicenseExpression& expr) { return to_lattice(expr, lookup_license_range); }

bool satisfies(const LicenseExpression& package, const LicenseExpression& policy, const LicenseRangeLookup& lookup) {
    return preorder(to_lattice(policy, lookup), to_lattice(package, lookup));
}

bool satisfies(const LicenseExpression& package, const LicenseExpression& policy) {
    return satisfies(package, policy, lookup_license_range);
}

} // namespace licsat
