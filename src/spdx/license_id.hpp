// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace licsat {

struct LicenseInfo {
    std::string_view id;
    std::string_view name;
    bool osi_approved{};
};

class LicenseId;
class LicenseExceptionId;

/// Case-insensitive lookup in the registered license table.
std::optional<LicenseId> make_license_id(std::string_view id);

/// Case-insensitive lookup in the registered exception table.
std::optional<LicenseExceptionId> make_license_exception_id(std::string_view id);

/// Registered license identifier, e.g. "MIT".
class LicenseId final {
    uint16_t index_{};

    explicit LicenseId(const uint16_t index) : index_{index} {}

    friend std::optional<LicenseId> make_license_id(std::string_view id);

  public:
    [[nodiscard]]
    uint16_t index() const {
        return index_;
    }

    /// Canonical spelling.
    [[nodiscard]]
    std::string_view str() const;

    [[nodiscard]]
    const LicenseInfo& info() const;

    bool operator==(const LicenseId&) const = default;
    auto operator<=>(const LicenseId&) const = default;
};

/// Registered license exception identifier, e.g. "Classpath-exception-2.0".
class LicenseExceptionId final {
    uint16_t index_{};

    explicit LicenseExceptionId(const uint16_t index) : index_{index} {}

    friend std::optional<LicenseExceptionId> make_license_exception_id(std::string_view id);

  public:
    [[nodiscard]]
    uint16_t index() const {
        return index_;
    }

    [[nodiscard]]
    std::string_view str() const;

    bool operator==(const LicenseExceptionId&) const = default;
    auto operator<=>(const LicenseExceptionId&) const = default;
};

/// User defined license: [DocumentRef-<document>:]LicenseRef-<license>.
struct LicenseRef {
    std::optional<std::string> document;
    std::string license;

    bool operator==(const LicenseRef&) const = default;
    auto operator<=>(const LicenseRef&) const = default;
};

std::span<const LicenseInfo> licenses();
std::vector<LicenseId> license_identifiers();
std::span<const std::string_view> license_exceptions();

inline std::string_view license_name(const LicenseId& id) { return id.info().name; }
inline bool is_osi_approved(const LicenseId& id) { return id.info().osi_approved; }

std::ostream& operator<<(std::ostream& os, const LicenseId& id);
std::ostream& operator<<(std::ostream& os, const LicenseExceptionId& id);
std::ostream& operator<<(std::ostream& os, const LicenseRef& ref);

} // namespace licsat
