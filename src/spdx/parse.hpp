// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "spdx/expression.hpp"

namespace licsat {

class ParseError final : public std::runtime_error {
    size_t position_;

  public:
    ParseError(const std::string& what, const size_t position)
        : std::runtime_error(what + " at position " + std::to_string(position)), position_{position} {}

    /// Offset into the input where parsing failed.
    [[nodiscard]]
    size_t position() const {
        return position_;
    }
};

/// Deepest parenthesis nesting parse_expression accepts.
constexpr size_t MAX_EXPRESSION_DEPTH = 100;

/// Most AND, OR and WITH operators parse_expression accepts in one expression.
constexpr size_t MAX_EXPRESSION_OPERATORS = 1000;

/// Parse an SPDX license expression. Throws ParseError, also when the expression exceeds
/// MAX_EXPRESSION_DEPTH or MAX_EXPRESSION_OPERATORS.
LicenseExpression parse_expression(std::string_view text);

/// Like parse_expression, but returns nullopt on malformed input.
std::optional<LicenseExpression> try_parse_expression(std::string_view text);

} // namespace licsat
