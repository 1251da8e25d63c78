// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <string>
#include <vector>

#include <powser/exceptions.hpp>
#include <powser/logging.hpp>
#include <powser/math/arith.hpp>
#include <powser/math/div.hpp>
#include <powser/math/exp.hpp>
#include <powser/math/mul.hpp>
#include <powser/math/sincos.hpp>
#include <powser/prefix.hpp>
#include <powser/series.hpp>

#include <catch2/catch.hpp>

#include "log_capture.hpp"
#include "test_utils.hpp"

using namespace powser;
using namespace powser_test;

using Catch::Matchers::Message;

TEST_CASE("div geometric")
{
    // 1/(1 - x) = 1 + x + x**2 + ...
    const auto g = div(one<rational>(), of_sequence({q(1), q(-1)}));

    REQUIRE(take(g, 6) == qvec({1, 1, 1, 1, 1, 1}));

    // 1/(1 + x)**2 = 1 - 2x + 3x**2 - ...
    const auto h = one<rational>() / (of_sequence({q(1), q(1)}) * of_sequence({q(1), q(1)}));
    REQUIRE(take(h, 5) == qvec({1, -2, 3, -4, 5}));
}

TEST_CASE("div scalar")
{
    const auto f = of_sequence({q(2), q(4)});

    REQUIRE(take(f / q(2), 3) == qvec({1, 2, 0}));
    REQUIRE(take(q(1) / of_sequence({q(2)}), 2) == std::vector{q(1, 2), q(0)});
    REQUIRE(take(of_sequence({1., 2.}) / 2., 2) == std::vector{.5, 1.});
}

TEST_CASE("div inverse of mul")
{
    const auto f = exp<rational>();
    const auto g = of_sequence({q(1), q(2), q(3)});
    const auto n = 10u;

    REQUIRE(same_prefix((f / g) * g, f, n));
    REQUIRE(same_prefix((f * g) / g, f, n));
    REQUIRE(same_prefix(f / f, one<rational>(), n));

    // sin/cos in terms of series with nonzero constant terms.
    REQUIRE(same_prefix((one<rational>() + sin<rational>()) / cos<rational>() * cos<rational>(),
                        one<rational>() + sin<rational>(), n));
}

TEST_CASE("div common factor")
{
    const auto x = identity<rational>();

    // x/x == 1.
    REQUIRE(take(x / x, 4) == qvec({1, 0, 0, 0}));

    // (x**2 * f)/(x**2 * g) == f/g.
    const auto f = of_sequence({q(1), q(1)});
    const auto g = of_sequence({q(1), q(-1)});
    REQUIRE(same_prefix((x * x * f) / (x * x * g), f / g, 8));

    // sin(x)/x = 1 - x**2/6 + x**4/120 - ...
    REQUIRE(take(sin<rational>() / x, 5) == std::vector{q(1), q(0), q(-1, 6), q(0), q(1, 120)});
}

TEST_CASE("div by zero")
{
    const auto x = identity<rational>();

    // Construction is lazy.
    const auto bad = one<rational>() / x;

    REQUIRE_THROWS_MATCHES(bad.head(), zero_division_error,
                           Message("Division by zero detected in a series quotient: after the cancellation of 0 common "
                                   "leading zero(s), the denominator has a zero constant term while the numerator "
                                   "does not"));

    REQUIRE_THROWS_MATCHES((x / (x * x)).head(), zero_division_error,
                           Message("Division by zero detected in a series quotient: after the cancellation of 1 common "
                                   "leading zero(s), the denominator has a zero constant term while the numerator "
                                   "does not"));

    REQUIRE_THROWS_AS((one<double>() / zero<double>())[2], zero_division_error);

    // NOTE: the quotient of two series which are both identically zero
    // never terminates, as the search for the first nonzero coefficient
    // goes on forever. Only the (lazy) construction is tested here.
    const auto undefined = zero<rational>() / zero<rational>();
    REQUIRE(undefined.is_owning());
}

TEST_CASE("div logging")
{
    const auto x = identity<rational>();

    const log_capture cap(log_level::debug);

    REQUIRE(take((x * x * exp<rational>()) / (x * x), 3) == std::vector{q(1), q(1), q(1, 2)});

#if !defined(NDEBUG)
    REQUIRE(cap.str().find("series division: cancelled the common factor x**2") != std::string::npos);
#endif
}
