// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <vector>

#include <powser/exceptions.hpp>
#include <powser/math/arith.hpp>
#include <powser/math/compose.hpp>
#include <powser/math/div.hpp>
#include <powser/math/exp.hpp>
#include <powser/math/mul.hpp>
#include <powser/math/sincos.hpp>
#include <powser/prefix.hpp>
#include <powser/series.hpp>

#include <catch2/catch.hpp>

#include "test_utils.hpp"

using namespace powser;
using namespace powser_test;

using Catch::Matchers::Message;

TEST_CASE("compose identity")
{
    const auto x = identity<rational>();
    const auto f = exp<rational>();

    REQUIRE(same_prefix(compose(f, x), f, 10));
    REQUIRE(same_prefix(compose(x, sin<rational>()), sin<rational>(), 10));
}

TEST_CASE("compose polynomials")
{
    const auto x = identity<rational>();

    // (1 + y)**2 with y = x + x**2.
    const auto f = of_sequence({q(1), q(2), q(1)});
    const auto g = of_sequence({q(0), q(1), q(1)});

    REQUIRE(take(compose(f, g), 6) == qvec({1, 2, 3, 2, 1, 0}));

    // 1/(1 - y) with y = x**2.
    const auto geom = one<rational>() / (one<rational>() - x);
    REQUIRE(take(compose(geom, x * x), 7) == qvec({1, 0, 1, 0, 1, 0, 1}));

    // Constant series are unaffected.
    REQUIRE(take(compose(constant(q(5)), x * x), 3) == qvec({5, 0, 0}));
}

TEST_CASE("compose transcendental")
{
    const auto x = identity<rational>();

    // exp(2x).
    REQUIRE(take(compose(exp<rational>(), x + x), 5) == std::vector{q(1), q(2), q(2), q(4, 3), q(2, 3)});

    // exp(x)*exp(-x) == 1.
    REQUIRE(same_prefix(exp<rational>() * compose(exp<rational>(), -x), one<rational>(), 10));

    // sin(2x) == 2 sin(x) cos(x).
    REQUIRE(same_prefix(compose(sin<rational>(), x + x), q(2) * sin<rational>() * cos<rational>(), 10));

    // exp(sin(x)) = 1 + x + x**2/2 - x**4/8 - ...
    REQUIRE(take(compose(exp<rational>(), sin<rational>()), 5) == std::vector{q(1), q(1), q(1, 2), q(0), q(-1, 8)});
}

TEST_CASE("compose nonzero constant")
{
    REQUIRE_THROWS_MATCHES(compose(exp<rational>(), one<rational>()), unsupported_operation_error,
                           Message("Cannot compose with a series whose constant term is nonzero (the constant term is "
                                   "1)"));
    REQUIRE_THROWS_MATCHES(compose(exp<rational>(), cos<rational>() / q(2)), unsupported_operation_error,
                           Message("Cannot compose with a series whose constant term is nonzero (the constant term is "
                                   "1/2)"));
    REQUIRE_THROWS_AS(compose(exp<double>(), one<double>()), unsupported_operation_error);
}
