// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#include <catch2/catch_all.hpp>

#include <string>

#include "spdx/parse.hpp"

using namespace licsat;

static LicenseExpression lic(const std::string_view id, const bool or_later = false) {
    return LicenseExpression::simple(make_license_id(id).value(), {}, or_later);
}

static void require_parse_error(const std::string_view text, const std::string& message, const size_t position) {
    INFO("parsing \"" << text << "\"");
    try {
        (void)parse_expression(text);
        FAIL("expected a parse error");
    } catch (const ParseError& e) {
        REQUIRE(std::string{e.what()} == message + " at position " + std::to_string(position));
        REQUIRE(e.position() == position);
    }
}

TEST_CASE("Parse simple licenses", "[parse]") {
    SECTION("Registered identifier") {
        REQUIRE(parse_expression("MIT") == lic("MIT"));
        REQUIRE(parse_expression("  MIT ") == lic("MIT"));
    }

    SECTION("Identifiers are case insensitive") {
        REQUIRE(parse_expression("mit") == lic("MIT"));
        REQUIRE(parse_expression("gpl-2.0") == lic("GPL-2.0"));
        REQUIRE(to_string(parse_expression("apache-2.0")) == "Apache-2.0");
    }

    SECTION("Or later") {
        REQUIRE(parse_expression("GPL-2.0+") == lic("GPL-2.0", true));
        REQUIRE(!(parse_expression("GPL-2.0+") == lic("GPL-2.0")));
    }

    SECTION("Exception") {
        const auto expected = LicenseExpression::simple(
            make_license_id("GPL-2.0").value(), make_license_exception_id("Classpath-exception-2.0"), true);
        REQUIRE(parse_expression("GPL-2.0+ WITH Classpath-exception-2.0") == expected);
        REQUIRE(parse_expression("GPL-2.0+ WITH classpath-exception-2.0") == expected);
    }

    SECTION("License reference") {
        const auto expr = parse_expression("LicenseRef-my-license.1");
        REQUIRE(expr == LicenseExpression::simple(LicenseRef{.document = {}, .license = "my-license.1"}));
    }

    SECTION("Document reference") {
        const auto expr = parse_expression("DocumentRef-spdx-tool-1.2:LicenseRef-MIT-Style-2+");
        REQUIRE(expr == LicenseExpression::simple(LicenseRef{.document = "spdx-tool-1.2", .license = "MIT-Style-2"},
                                                  {}, true));
    }
}

TEST_CASE("Parse compound expressions", "[parse]") {
    SECTION("AND binds tighter than OR") {
        REQUIRE(parse_expression("MIT OR ISC AND Zlib") ==
                LicenseExpression::disjunction(lic("MIT"), LicenseExpression::conjunction(lic("ISC"), lic("Zlib"))));
        REQUIRE(parse_expression("MIT AND ISC OR Zlib") ==
                LicenseExpression::disjunction(LicenseExpression::conjunction(lic("MIT"), lic("ISC")), lic("Zlib")));
    }

    SECTION("Operators associate to the left") {
        REQUIRE(parse_expression("MIT AND ISC AND Zlib") ==
                LicenseExpression::conjunction(LicenseExpression::conjunction(lic("MIT"), lic("ISC")), lic("Zlib")));
        REQUIRE(parse_expression("MIT OR ISC OR Zlib") ==
                LicenseExpression::disjunction(LicenseExpression::disjunction(lic("MIT"), lic("ISC")), lic("Zlib")));
    }

    SECTION("Parentheses") {
        REQUIRE(parse_expression("(MIT OR ISC) AND Zlib") ==
                LicenseExpression::conjunction(LicenseExpression::disjunction(lic("MIT"), lic("ISC")), lic("Zlib")));
        REQUIRE(parse_expression("MIT AND (ISC AND Zlib)") ==
                LicenseExpression::conjunction(lic("MIT"), LicenseExpression::conjunction(lic("ISC"), lic("Zlib"))));
        REQUIRE(parse_expression("((MIT))") == lic("MIT"));
    }

    SECTION("WITH binds tighter than AND") {
        const auto gpl_cp = LicenseExpression::simple(make_license_id("GPL-2.0").value(),
                                                      make_license_exception_id("Classpath-exception-2.0"));
        REQUIRE(parse_expression("MIT AND GPL-2.0 WITH Classpath-exception-2.0") ==
                LicenseExpression::conjunction(lic("MIT"), gpl_cp));
    }
}

TEST_CASE("Parse errors", "[parse]") {
    require_parse_error("", "unexpected end of expression", 0);
    require_parse_error("MIT AND", "unexpected end of expression", 7);
    require_parse_error("MIT OR OR ISC", "expected license, got 'OR'", 7);
    require_parse_error("(MIT", "expected ')'", 4);
    require_parse_error("MIT)", "unexpected ')'", 3);
    require_parse_error("MIT ISC", "unexpected 'ISC'", 4);
    require_parse_error("MIT and ISC", "unexpected 'and'", 4);
    require_parse_error("MIT $", "unexpected character '$'", 4);
    require_parse_error("Foo", "unknown license identifier 'Foo'", 0);
    require_parse_error("MIT WITH Foo", "unknown license exception 'Foo'", 9);
    require_parse_error("MIT WITH", "expected license exception after WITH", 8);
    require_parse_error("MIT WITH Classpath-exception-2.0+", "'+' is not allowed after a license exception", 9);
    require_parse_error("(MIT OR ISC) WITH Classpath-exception-2.0", "WITH applies to a simple license only", 13);
    require_parse_error("LicenseRef-", "invalid license reference 'LicenseRef-'", 0);
    require_parse_error("DocumentRef-doc", "expected ':' after document reference", 0);
    require_parse_error("DocumentRef-doc:MIT", "expected license reference in 'DocumentRef-doc:MIT'", 0);
}

TEST_CASE("try_parse_expression", "[parse]") {
    REQUIRE(try_parse_expression("MIT OR ISC").has_value());
    REQUIRE(!try_parse_expression("MIT OR").has_value());
    REQUIRE(!try_parse_expression("NotALicense").has_value());
}

TEST_CASE("Print expressions", "[parse][print]") {
    SECTION("Canonical spelling") {
        REQUIRE(to_string(parse_expression("mit OR isc")) == "MIT OR ISC");
        REQUIRE(to_string(parse_expression("gpl-2.0+ WITH classpath-exception-2.0")) ==
                "GPL-2.0+ WITH Classpath-exception-2.0");
        REQUIRE(to_string(parse_expression("DocumentRef-d:LicenseRef-x")) == "DocumentRef-d:LicenseRef-x");
    }

    SECTION("Minimal parentheses") {
        REQUIRE(to_string(parse_expression("(MIT OR ISC) AND Zlib")) == "(MIT OR ISC) AND Zlib");
        REQUIRE(to_string(parse_expression("(MIT AND ISC) OR Zlib")) == "MIT AND ISC OR Zlib");
        REQUIRE(to_string(parse_expression("MIT AND (ISC AND Zlib)")) == "MIT AND (ISC AND Zlib)");
        REQUIRE(to_string(parse_expression("(MIT AND ISC) AND Zlib")) == "MIT AND ISC AND Zlib");
        REQUIRE(to_string(parse_expression("MIT OR (ISC OR Zlib)")) == "MIT OR (ISC OR Zlib)");
    }

    SECTION("Printed expressions parse back to the same tree") {
        for (const std::string_view text : {
                 "MIT",
                 "GPL-2.0+ WITH Classpath-exception-2.0",
                 "MIT AND (ISC OR Zlib)",
                 "(MIT OR ISC) AND (Zlib OR GPL-3.0+)",
                 "MIT OR (ISC OR (Zlib AND LicenseRef-x))",
                 "DocumentRef-d:LicenseRef-x AND (MIT AND ISC)",
             }) {
            INFO(text);
            const auto expr = parse_expression(text);
            REQUIRE(parse_expression(to_string(expr)) == expr);
        }
    }
}

static std::string or_chain(const size_t operators) {
    std::string res = "MIT";
    for (size_t i = 0; i < operators; ++i) {
        res += " OR MIT";
    }
    return res;
}

static std::string nested(const size_t depth) {
    return std::string(depth, '(') + "MIT" + std::string(depth, ')');
}

TEST_CASE("Expression size limits", "[parse]") {
    SECTION("Nesting up to the limit") {
        REQUIRE(parse_expression(nested(MAX_EXPRESSION_DEPTH)) == lic("MIT"));
        REQUIRE(parse_expression("(MIT) AND " + nested(MAX_EXPRESSION_DEPTH)) ==
                LicenseExpression::conjunction(lic("MIT"), lic("MIT")));
    }

    SECTION("Nesting too deep") {
        require_parse_error(nested(MAX_EXPRESSION_DEPTH + 1), "expression nested too deeply (limit 100)",
                            MAX_EXPRESSION_DEPTH);
        REQUIRE(!try_parse_expression(nested(10000)).has_value());
    }

    SECTION("Operators up to the limit") {
        REQUIRE(try_parse_expression(or_chain(MAX_EXPRESSION_OPERATORS)).has_value());
    }

    SECTION("Too many operators") {
        // "MIT" followed by " OR MIT" repeated: the k-th OR starts at 7k - 3.
        require_parse_error(or_chain(MAX_EXPRESSION_OPERATORS + 1), "too many operators (limit 1000)",
                            7 * (MAX_EXPRESSION_OPERATORS + 1) - 3);
        REQUIRE(!try_parse_expression(or_chain(10000)).has_value());
    }

    SECTION("WITH counts as an operator") {
        std::string text = "GPL-2.0 WITH Classpath-exception-2.0";
        for (size_t i = 1; i < MAX_EXPRESSION_OPERATORS / 2; ++i) {
            text += " AND GPL-2.0 WITH Classpath-exception-2.0";
        }
        REQUIRE(try_parse_expression(text).has_value());
        text += " AND GPL-2.0 WITH Classpath-exception-2.0";
        REQUIRE(!try_parse_expression(text).has_value());
    }
}
