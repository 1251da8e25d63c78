// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef POWSER_MATH_HPP
#define POWSER_MATH_HPP

#include <powser/math/arith.hpp>
#include <powser/math/calculus.hpp>
#include <powser/math/compose.hpp>
#include <powser/math/div.hpp>
#include <powser/math/exp.hpp>
#include <powser/math/mul.hpp>
#include <powser/math/pow.hpp>
#include <powser/math/revert.hpp>
#include <powser/math/sincos.hpp>
#include <powser/math/sqrt.hpp>
#include <powser/math/tan.hpp>

#endif
