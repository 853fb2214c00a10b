// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <variant>

#include "spdx/license_id.hpp"

namespace licsat {

// Either a user defined reference or a registered identifier.
using LicenseIdentity = std::variant<LicenseRef, LicenseId>;

std::string to_string(const LicenseIdentity& license);

/// A single license term: "MIT", "GPL-2.0+", "GPL-2.0 WITH Classpath-exception-2.0".
struct SimpleLicense {
    LicenseIdentity license;
    std::optional<LicenseExceptionId> exception;
    bool or_later{};

    bool operator==(const SimpleLicense&) const = default;
};

class LicenseExpression;

/// l AND r.
struct EConjunction {
    std::shared_ptr<const LicenseExpression> left;
    std::shared_ptr<const LicenseExpression> right;

    bool operator==(const EConjunction& other) const;
};

/// l OR r.
struct EDisjunction {
    std::shared_ptr<const LicenseExpression> left;
    std::shared_ptr<const LicenseExpression> right;

    bool operator==(const EDisjunction& other) const;
};

class LicenseExpression final {
  public:
    using Node = std::variant<SimpleLicense, EConjunction, EDisjunction>;

  private:
    Node node_;

    explicit LicenseExpression(Node node) : node_{std::move(node)} {}

  public:
    static LicenseExpression simple(SimpleLicense license) { return LicenseExpression{std::move(license)}; }

    static LicenseExpression simple(LicenseIdentity license, std::optional<LicenseExceptionId> exception = {},
                                    const bool or_later = false) {
        return simple(SimpleLicense{std::move(license), exception, or_later});
    }

    static LicenseExpression conjunction(LicenseExpression a, LicenseExpression b);
    static LicenseExpression disjunction(LicenseExpression a, LicenseExpression b);

    [[nodiscard]]
    const Node& node() const {
        return node_;
    }

    bool operator==(const LicenseExpression& other) const { return node_ == other.node_; }
};

std::ostream& operator<<(std::ostream& os, const SimpleLicense& license);
std::ostream& operator<<(std::ostream& os, const LicenseExpression& expr);

std::string to_string(const LicenseExpression& expr);

} // namespace licsat
