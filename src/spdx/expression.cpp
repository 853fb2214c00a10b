// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#include <sstream>

#include "spdx/expression.hpp"

namespace licsat {

bool EConjunction::operator==(const EConjunction& other) const {
    return *left == *other.left && *right == *other.right;
}

bool EDisjunction::operator==(const EDisjunction& other) const {
    return *left == *other.left && *right == *other.right;
}

LicenseExpression LicenseExpression::conjunction(LicenseExpression a, LicenseExpression b) {
    return LicenseExpression{EConjunction{std::make_shared<const LicenseExpression>(std::move(a)),
                                          std::make_shared<const LicenseExpression>(std::move(b))}};
}

LicenseExpression LicenseExpression::disjunction(LicenseExpression a, LicenseExpression b) {
    return LicenseExpression{EDisjunction{std::make_shared<const LicenseExpression>(std::move(a)),
                                          std::make_shared<const LicenseExpression>(std::move(b))}};
}

std::string to_string(const LicenseIdentity& license) {
    std::ostringstream os;
    std::visit([&](const auto& l) { os << l; }, license);
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const SimpleLicense& license) {
    os << to_string(license.license);
    if (license.or_later) {
        os << "+";
    }
    if (license.exception) {
        os << " WITH " << *license.exception;
    }
    return os;
}

// Operands are parenthesized where the parser would otherwise build a different tree:
// AND binds tighter than OR, and both associate to the left.
struct ExpressionPrinterVisitor {
    std::ostream& os_;

    void print_operand(const LicenseExpression& e, const bool parenthesize) {
        if (parenthesize) {
            os_ << "(";
        }
        std::visit(*this, e.node());
        if (parenthesize) {
            os_ << ")";
        }
    }

    static bool is_disjunction(const LicenseExpression& e) { return std::holds_alternative<EDisjunction>(e.node()); }

    static bool is_conjunction(const LicenseExpression& e) { return std::holds_alternative<EConjunction>(e.node()); }

    void operator()(const SimpleLicense& s) { os_ << s; }

    void operator()(const EConjunction& c) {
        print_operand(*c.left, is_disjunction(*c.left));
        os_ << " AND ";
        print_operand(*c.right, is_disjunction(*c.right) || is_conjunction(*c.right));
    }

    void operator()(const EDisjunction& d) {
        print_operand(*d.left, false);
        os_ << " OR ";
        print_operand(*d.right, is_disjunction(*d.right));
    }
};

std::ostream& operator<<(std::ostream& os, const LicenseExpression& expr) {
    std::visit(ExpressionPrinterVisitor{os}, expr.node());
    return os;
}

std::string to_string(const LicenseExpression& expr) {
    std::ostringstream os;
    os << expr;
    return os.str();
}

} // namespace licsat
