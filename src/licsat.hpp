// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include "config.hpp"
#include "lattice/brute_force.hpp"
#include "lattice/lattice_syntax.hpp"
#include "license_checker.hpp"
#include "spdx/expression.hpp"
#include "spdx/license_id.hpp"
#include "spdx/parse.hpp"
#include "spdx/ranges.hpp"
#include "spdx/satisfies.hpp"
