// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <concepts>
#include <memory>
#include <ostream>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace licsat {

// Atomic terms only need equality; copies are made when paths are extended.
template <typename T>
concept LatticeTerm = std::equality_comparable<T> && std::copy_constructible<T>;

template <LatticeTerm T>
class LatticeSyntax;

/// Variable.
template <LatticeTerm T>
struct LVar {
    T v;
    bool operator==(const LVar&) const = default;
};

/// Constant: true is top, false is bottom.
struct LBound {
    bool v{};
    constexpr bool operator==(const LBound&) const = default;
};

/// Least upper bound (logical or).
template <LatticeTerm T>
struct LJoin {
    std::shared_ptr<const LatticeSyntax<T>> left;
    std::shared_ptr<const LatticeSyntax<T>> right;

    bool operator==(const LJoin& other) const { return *left == *other.left && *right == *other.right; }
};

/// Greatest lower bound (logical and).
template <LatticeTerm T>
struct LMeet {
    std::shared_ptr<const LatticeSyntax<T>> left;
    std::shared_ptr<const LatticeSyntax<T>> right;

    bool operator==(const LMeet& other) const { return *left == *other.left && *right == *other.right; }
};

// Immutable formula tree. Subtrees are shared, never modified after construction.
template <LatticeTerm T>
class LatticeSyntax final {
  public:
    using Node = std::variant<LVar<T>, LBound, LJoin<T>, LMeet<T>>;

  private:
    Node node_;

    explicit LatticeSyntax(Node node) : node_{std::move(node)} {}

    static std::shared_ptr<const LatticeSyntax> share(LatticeSyntax f) {
        return std::make_shared<const LatticeSyntax>(std::move(f));
    }

  public:
    static LatticeSyntax var(T v) { return LatticeSyntax{LVar<T>{std::move(v)}}; }

    static LatticeSyntax bound(const bool b) { return LatticeSyntax{LBound{b}}; }

    static LatticeSyntax top() { return bound(true); }

    static LatticeSyntax bottom() { return bound(false); }

    static LatticeSyntax join(LatticeSyntax a, LatticeSyntax b) {
        return LatticeSyntax{LJoin<T>{share(std::move(a)), share(std::move(b))}};
    }

    static LatticeSyntax meet(LatticeSyntax a, LatticeSyntax b) {
        return LatticeSyntax{LMeet<T>{share(std::move(a)), share(std::move(b))}};
    }

    [[nodiscard]]
    const Node& node() const {
        return node_;
    }

    [[nodiscard]]
    bool is_var() const {
        return std::holds_alternative<LVar<T>>(node_);
    }

    [[nodiscard]]
    bool is_top() const {
        const auto b = std::get_if<LBound>(&node_);
        return b && b->v;
    }

    [[nodiscard]]
    bool is_bottom() const {
        const auto b = std::get_if<LBound>(&node_);
        return b && !b->v;
    }

    // Structural equality. Use equivalent() for semantic equality.
    bool operator==(const LatticeSyntax& other) const { return node_ == other.node_; }

    LatticeSyntax operator|(const LatticeSyntax& other) const { return join(*this, other); }

    LatticeSyntax operator&(const LatticeSyntax& other) const { return meet(*this, other); }
};

// De Morgan dual: swap join and meet, negate constants, keep variables.
template <LatticeTerm T>
LatticeSyntax<T> dual(const LatticeSyntax<T>& f) {
    struct DualVisitor {
        LatticeSyntax<T> operator()(const LVar<T>& x) const { return LatticeSyntax<T>::var(x.v); }
        LatticeSyntax<T> operator()(const LBound& b) const { return LatticeSyntax<T>::bound(!b.v); }
        LatticeSyntax<T> operator()(const LJoin<T>& j) const {
            return LatticeSyntax<T>::meet(dual(*j.left), dual(*j.right));
        }
        LatticeSyntax<T> operator()(const LMeet<T>& m) const {
            return LatticeSyntax<T>::join(dual(*m.left), dual(*m.right));
        }
    };
    return std::visit(DualVisitor{}, f.node());
}

template <LatticeTerm T>
void collect_free_vars(const LatticeSyntax<T>& f, std::vector<T>& out) {
    if (const auto x = std::get_if<LVar<T>>(&f.node())) {
        out.push_back(x->v);
    } else if (const auto j = std::get_if<LJoin<T>>(&f.node())) {
        collect_free_vars(*j->left, out);
        collect_free_vars(*j->right, out);
    } else if (const auto m = std::get_if<LMeet<T>>(&f.node())) {
        collect_free_vars(*m->left, out);
        collect_free_vars(*m->right, out);
    }
}

// Variables in left-to-right order. Repeated occurrences are kept.
template <LatticeTerm T>
std::vector<T> free_vars(const LatticeSyntax<T>& f) {
    std::vector<T> res;
    collect_free_vars(f, res);
    return res;
}

// Replace every variable v by the formula g(v). The leaf type may change.
template <LatticeTerm T, typename F>
auto substitute(const LatticeSyntax<T>& f, const F& g) -> decltype(g(std::declval<const T&>())) {
    using Result = decltype(g(std::declval<const T&>()));
    struct SubstituteVisitor {
        const F& g;
        Result operator()(const LVar<T>& x) const { return g(x.v); }
        Result operator()(const LBound& b) const { return Result::bound(b.v); }
        Result operator()(const LJoin<T>& j) const { return Result::join(substitute(*j.left, g), substitute(*j.right, g)); }
        Result operator()(const LMeet<T>& m) const { return Result::meet(substitute(*m.left, g), substitute(*m.right, g)); }
    };
    return std::visit(SubstituteVisitor{g}, f.node());
}

// Relabel every variable v as g(v).
template <LatticeTerm T, typename F>
auto map_vars(const LatticeSyntax<T>& f, const F& g) {
    using U = std::remove_cvref_t<decltype(g(std::declval<const T&>()))>;
    return substitute(f, [&](const T& v) { return LatticeSyntax<U>::var(g(v)); });
}

template <LatticeTerm T>
std::ostream& operator<<(std::ostream& os, const LatticeSyntax<T>& f) {
    struct PrintVisitor {
        std::ostream& os_;
        void operator()(const LVar<T>& x) const { os_ << x.v; }
        void operator()(const LBound& b) const { os_ << (b.v ? "top" : "bottom"); }
        void operator()(const LJoin<T>& j) const { os_ << "(" << *j.left << " \\/ " << *j.right << ")"; }
        void operator()(const LMeet<T>& m) const { os_ << "(" << *m.left << " /\\ " << *m.right << ")"; }
    };
    std::visit(PrintVisitor{os}, f.node());
    return os;
}

} // namespace licsat
