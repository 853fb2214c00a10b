// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#include <cctype>
#include <iostream>
#include <string>
#include <vector>

#include "spdx/parse.hpp"
#include "utils/debug.hpp"

namespace licsat {

static constexpr std::string_view LICENSE_REF_PREFIX = "LicenseRef-";
static constexpr std::string_view DOCUMENT_REF_PREFIX = "DocumentRef-";

struct Token {
    enum class Kind { LPAREN, RPAREN, WORD, END };
    Kind kind;
    std::string text;
    bool plus{}; ///< WORD immediately followed by '+'.
    size_t position{};
};

static bool is_word_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == ':';
}

static bool is_idstring(const std::string_view s) {
    if (s.empty()) {
        return false;
    }
    for (const char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-') {
            return false;
        }
    }
    return true;
}

static std::vector<Token> tokenize(const std::string_view text) {
    std::vector<Token> res;
    size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            i++;
        } else if (c == '(') {
            res.push_back(Token{Token::Kind::LPAREN, "(", false, i++});
        } else if (c == ')') {
            res.push_back(Token{Token::Kind::RPAREN, ")", false, i++});
        } else if (is_word_char(c)) {
            const size_t start = i;
            while (i < text.size() && is_word_char(text[i])) {
                i++;
            }
            Token token{Token::Kind::WORD, std::string{text.substr(start, i - start)}, false, start};
            if (i < text.size() && text[i] == '+') {
                token.plus = true;
                i++;
            }
            res.push_back(std::move(token));
        } else {
            throw ParseError(std::string{"unexpected character '"} + c + "'", i);
        }
    }
    res.push_back(Token{Token::Kind::END, "", false, text.size()});
    return res;
}

// Recursive descent over the token list. WITH binds tighter than AND, AND tighter than OR.
class ExpressionParser final {
    std::vector<Token> tokens_;
    size_t next_{};
    size_t depth_{};
    size_t operators_{};

    [[nodiscard]]
    const Token& peek() const {
        return tokens_.at(next_);
    }

    const Token& advance() { return tokens_.at(next_++); }

    [[nodiscard]]
    bool at_keyword(const std::string_view keyword) const {
        const Token& t = peek();
        return t.kind == Token::Kind::WORD && t.text == keyword;
    }

    static bool is_keyword(const Token& t) { return t.text == "AND" || t.text == "OR" || t.text == "WITH"; }

    // Formulas are evaluated recursively, so their depth must stay bounded.
    void count_operator(const Token& t) {
        if (++operators_ > MAX_EXPRESSION_OPERATORS) {
            fail("too many operators (limit " + std::to_string(MAX_EXPRESSION_OPERATORS) + ")", t);
        }
    }

    [[noreturn]]
    static void fail(const std::string& message, const Token& at) {
        throw ParseError(message, at.position);
    }

    static LicenseRef parse_ref(const Token& t) {
        std::string_view text = t.text;
        LicenseRef ref;
        if (text.starts_with(DOCUMENT_REF_PREFIX)) {
            const size_t colon = text.find(':');
            if (colon == std::string_view::npos) {
                fail("expected ':' after document reference", t);
            }
            const std::string_view document = text.substr(DOCUMENT_REF_PREFIX.size(), colon - DOCUMENT_REF_PREFIX.size());
            if (!is_idstring(document)) {
                fail("invalid document reference '" + t.text + "'", t);
            }
            ref.document = std::string{document};
            text = text.substr(colon + 1);
        }
        if (!text.starts_with(LICENSE_REF_PREFIX)) {
            fail("expected license reference in '" + t.text + "'", t);
        }
        const std::string_view license = text.substr(LICENSE_REF_PREFIX.size());
        if (!is_idstring(license)) {
            fail("invalid license reference '" + t.text + "'", t);
        }
        ref.license = std::string{license};
        return ref;
    }

    SimpleLicense parse_license() {
        const Token& t = advance();
        if (t.kind != Token::Kind::WORD || is_keyword(t)) {
            fail(t.kind == Token::Kind::END ? "unexpected end of expression" : "expected license, got '" + t.text + "'",
                 t);
        }
        SimpleLicense res;
        res.or_later = t.plus;
        if (t.text.starts_with(LICENSE_REF_PREFIX) || t.text.starts_with(DOCUMENT_REF_PREFIX)) {
            res.license = parse_ref(t);
        } else if (const auto id = make_license_id(t.text)) {
            res.license = *id;
        } else {
            fail("unknown license identifier '" + t.text + "'", t);
        }
        return res;
    }

    LicenseExceptionId parse_exception() {
        const Token& t = advance();
        if (t.kind != Token::Kind::WORD || is_keyword(t)) {
            fail("expected license exception after WITH", t);
        }
        if (t.plus) {
            fail("'+' is not allowed after a license exception", t);
        }
        const auto id = make_license_exception_id(t.text);
        if (!id) {
            fail("unknown license exception '" + t.text + "'", t);
        }
        return *id;
    }

    LicenseExpression parse_with() {
        if (peek().kind == Token::Kind::LPAREN) {
            const Token& open = advance();
            if (++depth_ > MAX_EXPRESSION_DEPTH) {
                fail("expression nested too deeply (limit " + std::to_string(MAX_EXPRESSION_DEPTH) + ")", open);
            }
            LicenseExpression inner = parse_or();
            --depth_;
            if (peek().kind != Token::Kind::RPAREN) {
                fail("expected ')'", peek());
            }
            advance();
            if (at_keyword("WITH")) {
                fail("WITH applies to a simple license only", peek());
            }
            return inner;
        }
        SimpleLicense license = parse_license();
        if (at_keyword("WITH")) {
            count_operator(advance());
            license.exception = parse_exception();
        }
        return LicenseExpression::simple(std::move(license));
    }

    LicenseExpression parse_and() {
        LicenseExpression lhs = parse_with();
        while (at_keyword("AND")) {
            count_operator(advance());
            lhs = LicenseExpression::conjunction(std::move(lhs), parse_with());
        }
        return lhs;
    }

    LicenseExpression parse_or() {
        LicenseExpression lhs = parse_and();
        while (at_keyword("OR")) {
            count_operator(advance());
            lhs = LicenseExpression::disjunction(std::move(lhs), parse_and());
        }
        return lhs;
    }

  public:
    explicit ExpressionParser(std::vector<Token> tokens) : tokens_{std::move(tokens)} {}

    LicenseExpression parse() {
        LicenseExpression res = parse_or();
        if (peek().kind != Token::Kind::END) {
            fail("unexpected '" + peek().text + "'", peek());
        }
        return res;
    }
};

LicenseExpression parse_expression(const std::string_view text) {
    LicenseExpression res = ExpressionParser{tokenize(text)}.parse();
    LICSAT_LOG("parse", std::cout << "parsed \"" << text << "\" as " << res << "\n");
    return res;
}

std::optional<LicenseExpression> try_parse_expression(const std::string_view text) {
    try {
        return parse_expression(text);
    } catch (const ParseError& e) {
        LICSAT_LOG("parse", std::cout << "rejected \"" << text << "\": " << e.what() << "\n");
        return std::nullopt;
    }
}

} // namespace licsat
