// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>

#include "lattice/lattice_syntax.hpp"
#include "utils/debug.hpp"

namespace licsat {

// Truth values chosen so far on one search path.
// Within a path a variable is bound at most once.
template <LatticeTerm T>
class Assignment final {
    std::vector<std::pair<T, bool>> bindings_;

  public:
    Assignment() = default;

    [[nodiscard]]
    std::optional<bool> lookup(const T& v) const {
        const auto it = std::ranges::find_if(bindings_, [&](const auto& binding) { return binding.first == v; });
        if (it == bindings_.end()) {
            return {};
        }
        return it->second;
    }

    // Paths are extended by copy; sibling branches never observe each other's choices.
    [[nodiscard]]
    Assignment extended(T v, const bool b) const {
        Assignment res{*this};
        res.bindings_.emplace_back(std::move(v), b);
        return res;
    }

    [[nodiscard]]
    size_t size() const {
        return bindings_.size();
    }

    [[nodiscard]]
    bool empty() const {
        return bindings_.empty();
    }
};

template <LatticeTerm T, typename V>
struct Branch {
    Assignment<T> assignment;
    V value;
};

struct SearchStats {
    size_t branches{}; ///< Complete paths handed to the consumer.
    size_t forks{};    ///< Variables opened with both truth values.
};

inline std::ostream& operator<<(std::ostream& os, const SearchStats& stats) {
    return os << "branches=" << stats.branches << " forks=" << stats.forks;
}

// Enumerates the boolean assignments that matter for one or two formulas.
//
// The search is depth first. A variable is opened (true first, then false) the first time it is
// reached on a path and reused afterwards. Join and meet short-circuit: the right operand is only
// evaluated on paths where the left operand did not decide the result, so variables that cannot
// affect the outcome on a path are never opened there.
template <LatticeTerm T>
class BruteForce final {
    // Receives a completed path and the value computed on it. Returning false stops the search.
    using Continuation = std::function<bool(const Assignment<T>&, bool)>;

    SearchStats stats_;

    bool search(const LatticeSyntax<T>& f, const Assignment<T>& path, const Continuation& k) {
        struct SearchVisitor {
            BruteForce& self;
            const Assignment<T>& path;
            const Continuation& k;

            bool operator()(const LVar<T>& x) const {
                if (const auto b = path.lookup(x.v)) {
                    return k(path, *b);
                }
                ++self.stats_.forks;
                if (!k(path.extended(x.v, true), true)) {
                    return false;
                }
                return k(path.extended(x.v, false), false);
            }

            bool operator()(const LBound& b) const { return k(path, b.v); }

            bool operator()(const LJoin<T>& j) const {
                return self.search(*j.left, path, [&](const Assignment<T>& p, const bool a) {
                    if (a) {
                        return k(p, true);
                    }
                    return self.search(*j.right, p, k);
                });
            }

            bool operator()(const LMeet<T>& m) const {
                return self.search(*m.left, path, [&](const Assignment<T>& p, const bool a) {
                    if (!a) {
                        return k(p, false);
                    }
                    return self.search(*m.right, p, k);
                });
            }
        };
        return std::visit(SearchVisitor{*this, path, k}, f.node());
    }

  public:
    [[nodiscard]]
    const SearchStats& stats() const {
        return stats_;
    }

    std::vector<Branch<T, bool>> evaluate(const LatticeSyntax<T>& f, const Assignment<T>& path = {}) {
        std::vector<Branch<T, bool>> res;
        search(f, path, [&](const Assignment<T>& p, const bool v) {
            ++stats_.branches;
            res.push_back(Branch<T, bool>{p, v});
            return true;
        });
        return res;
    }

    // Both formulas are evaluated on the same path, so a variable shared by a and b gets one value.
    std::vector<Branch<T, std::pair<bool, bool>>> evaluate(const LatticeSyntax<T>& a, const LatticeSyntax<T>& b) {
        std::vector<Branch<T, std::pair<bool, bool>>> res;
        search(a, {}, [&](const Assignment<T>& pa, const bool va) {
            return search(b, pa, [&](const Assignment<T>& pb, const bool vb) {
                ++stats_.branches;
                res.push_back(Branch<T, std::pair<bool, bool>>{pb, {va, vb}});
                return true;
            });
        });
        return res;
    }

    // a == b under every assignment. The first disagreeing path refutes it.
    bool equivalent(const LatticeSyntax<T>& a, const LatticeSyntax<T>& b) {
        bool agree = true;
        search(a, {}, [&](const Assignment<T>& pa, const bool va) {
            return search(b, pa, [&](const Assignment<T>&, const bool vb) {
                ++stats_.branches;
                if (va != vb) {
                    agree = false;
                    return false;
                }
                return true;
            });
        });
        LICSAT_LOG("eval", std::cout << "equivalent -> " << agree << " (" << stats_ << ")\n");
        return agree;
    }

    // a <= b iff a \/ b == b.
    bool preorder(const LatticeSyntax<T>& a, const LatticeSyntax<T>& b) { return equivalent(a | b, b); }

    bool satisfiable(const LatticeSyntax<T>& f) {
        bool found = false;
        search(f, {}, [&](const Assignment<T>&, const bool v) {
            ++stats_.branches;
            found = v;
            return !v;
        });
        LICSAT_LOG("eval", std::cout << "satisfiable -> " << found << " (" << stats_ << ")\n");
        return found;
    }
};

template <LatticeTerm T>
std::vector<Branch<T, bool>> evaluate(const LatticeSyntax<T>& f) {
    return BruteForce<T>{}.evaluate(f);
}

template <LatticeTerm T>
std::vector<Branch<T, std::pair<bool, bool>>> evaluate(const LatticeSyntax<T>& a, const LatticeSyntax<T>& b) {
    return BruteForce<T>{}.evaluate(a, b);
}

/// Test for equivalence.
template <LatticeTerm T>
bool equivalent(const LatticeSyntax<T>& a, const LatticeSyntax<T>& b) {
    return BruteForce<T>{}.equivalent(a, b);
}

/// Test for preorder: a <= b iff a \/ b == b iff a == a /\ b.
template <LatticeTerm T>
bool preorder(const LatticeSyntax<T>& a, const LatticeSyntax<T>& b) {
    return BruteForce<T>{}.preorder(a, b);
}

/// True if some assignment evaluates the formula to true.
template <LatticeTerm T>
bool satisfiable(const LatticeSyntax<T>& f) {
    return BruteForce<T>{}.satisfiable(f);
}

} // namespace licsat
