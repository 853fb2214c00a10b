// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#pragma once

namespace licsat {

struct verbosity_options_t {
    /// Print the lattice formulas the expressions translate to.
    bool print_formulas = false;

    /// Print search statistics.
    bool print_stats = false;
};

struct licsat_options_t {
    // When false, "id+" is a single variable, the way license references are treated.
    bool expand_ranges = true;

    verbosity_options_t verbosity_opts;
};

} // namespace licsat
