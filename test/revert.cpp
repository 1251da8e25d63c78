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
#include <powser/math/revert.hpp>
#include <powser/math/sincos.hpp>
#include <powser/math/tan.hpp>
#include <powser/prefix.hpp>
#include <powser/series.hpp>

#include <catch2/catch.hpp>

#include "test_utils.hpp"

using namespace powser;
using namespace powser_test;

using Catch::Matchers::Message;

TEST_CASE("revert identity")
{
    const auto x = identity<rational>();

    REQUIRE(same_prefix(revert(x), x, 8));

    // The inverse of 2x is x/2.
    REQUIRE(take(revert(x + x), 4) == std::vector{q(0), q(1, 2), q(0), q(0)});
}

TEST_CASE("revert inverse law")
{
    const auto x = identity<rational>();

    // y = x + x**2 has inverse (-1 + sqrt(1 + 4x))/2 = x - x**2 + 2x**3 - 5x**4 + 14x**5 - ...
    const auto f = of_sequence({q(0), q(1), q(1)});
    const auto r = revert(f);

    REQUIRE(take(r, 6) == qvec({0, 1, -1, 2, -5, 14}));
    REQUIRE(same_prefix(compose(f, r), x, 10));
    REQUIRE(same_prefix(compose(r, f), x, 10));

    // x/(1 - x) and x/(1 + x) are each other's inverse.
    const auto g = x / (one<rational>() - x);
    REQUIRE(same_prefix(revert(g), x / (one<rational>() + x), 10));
}

TEST_CASE("revert transcendental")
{
    // arcsin.
    REQUIRE(take(revert(sin<rational>()), 6) == std::vector{q(0), q(1), q(0), q(1, 6), q(0), q(3, 40)});

    // arctan.
    REQUIRE(take(revert(tan<rational>()), 6) == std::vector{q(0), q(1), q(0), q(-1, 3), q(0), q(1, 5)});

    // log(1 + x) is the inverse of exp(x) - 1.
    REQUIRE(take(revert(exp<rational>() - q(1)), 5) == std::vector{q(0), q(1), q(-1, 2), q(1, 3), q(-1, 4)});
}

TEST_CASE("revert lifetime")
{
    series<rational> t;

    {
        const auto r = revert(sin<rational>());
        t = r.tail();
    }

    // The reversion is kept alive by its tail.
    REQUIRE(take(t, 3) == std::vector{q(1), q(0), q(1, 6)});
}

TEST_CASE("revert errors")
{
    REQUIRE_THROWS_MATCHES(revert(exp<rational>()), unsupported_operation_error,
                           Message("Cannot revert a series whose constant term is nonzero (the constant term is 1)"));

    // A vanishing linear term makes the reversion undefined.
    const auto x = identity<rational>();
    const auto r = revert(x * x);

    REQUIRE(r.head() == q(0));
    REQUIRE_THROWS_AS(r[1], zero_division_error);
}
