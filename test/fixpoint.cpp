// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <stdexcept>
#include <utility>
#include <vector>

#include <powser/exceptions.hpp>
#include <powser/fixpoint.hpp>
#include <powser/math/arith.hpp>
#include <powser/math/calculus.hpp>
#include <powser/math/mul.hpp>
#include <powser/prefix.hpp>
#include <powser/series.hpp>

#include <catch2/catch.hpp>

#include "test_utils.hpp"

using namespace powser;
using namespace powser_test;

using Catch::Matchers::Message;

TEST_CASE("fixpoint basic")
{
    fixpoint<rational> fp;

    REQUIRE(fp.size() == 1u);
    REQUIRE(!fp.is_bound());

    const auto e = fp.ref();
    REQUIRE(!e.is_owning());

    // e = 1 + integrate(e).
    const auto ret = fp.bind(one<rational>() + integrate(e));

    REQUIRE(fp.is_bound());
    REQUIRE(ret.is_owning());
    REQUIRE(take(ret, 5) == std::vector{q(1), q(1), q(1, 2), q(1, 6), q(1, 24)});

    // The placeholder now reads the bound definition.
    REQUIRE(take(e, 5) == take(ret, 5));
}

TEST_CASE("fixpoint errors")
{
    REQUIRE_THROWS_MATCHES(fixpoint<rational>(0), std::invalid_argument,
                           Message("A recursive series definition must have at least one member"));

    fixpoint<rational> fp(2);

    REQUIRE(fp.size() == 2u);
    REQUIRE(fp.refs().size() == 2u);

    REQUIRE_THROWS_MATCHES(fp.ref(2), std::invalid_argument,
                           Message("Cannot fetch the member at index 2 of a recursive series definition with only 2 "
                                   "member(s)"));

    // Reading before binding.
    REQUIRE_THROWS_MATCHES(fp.ref(0).head(), fixpoint_error,
                           Message("A recursive series definition was read before being bound"));
    REQUIRE_THROWS_MATCHES(take(fp.ref(1), 3), fixpoint_error,
                           Message("A recursive series definition was read before being bound"));

    REQUIRE_THROWS_MATCHES(fp.bind(one<rational>()), std::invalid_argument,
                           Message("A single definition can be bound only to a recursive series definition with one "
                                   "member, but this recursive series definition has 2 members"));
    REQUIRE_THROWS_MATCHES(fp.bind(std::vector{one<rational>()}), std::invalid_argument,
                           Message("Invalid number of definitions passed to the bind() function of a recursive series "
                                   "definition: 2 were expected, but 1 were provided instead"));

    // A failed bind leaves the definition unbound.
    REQUIRE(!fp.is_bound());

    auto ret = fp.bind({one<rational>(), zero<rational>()});
    REQUIRE(ret.size() == 2u);

    REQUIRE_THROWS_MATCHES(fp.bind({one<rational>(), zero<rational>()}), fixpoint_error,
                           Message("A recursive series definition cannot be bound more than once"));
}

TEST_CASE("fixpoint moved from")
{
    fixpoint<rational> fp;
    const auto e = fp.ref();

    auto fp2(std::move(fp));

    const auto msg = Message("Cannot use a recursive series definition which has been moved from");

    // NOLINTBEGIN(bugprone-use-after-move,clang-analyzer-cplusplus.Move)
    REQUIRE_THROWS_MATCHES(fp.size(), std::invalid_argument, msg);
    REQUIRE_THROWS_MATCHES(fp.is_bound(), std::invalid_argument, msg);
    REQUIRE_THROWS_MATCHES(fp.ref(), std::invalid_argument, msg);
    REQUIRE_THROWS_MATCHES(fp.refs(), std::invalid_argument, msg);
    REQUIRE_THROWS_MATCHES(fp.bind(one<rational>()), std::invalid_argument, msg);
    REQUIRE_THROWS_MATCHES(fp.bind(std::vector{one<rational>()}), std::invalid_argument, msg);
    // NOLINTEND(bugprone-use-after-move,clang-analyzer-cplusplus.Move)

    // The moved-to object is fully functional, and the placeholders
    // created before the move are still valid.
    REQUIRE(fp2.size() == 1u);
    REQUIRE(!fp2.is_bound());

    const auto ret = fp2.bind(cons(q(1), [e]() { return e; }));
    REQUIRE(take(ret, 3) == qvec({1, 1, 1}));
    REQUIRE(take(e, 3) == qvec({1, 1, 1}));

    // Move assignment revives a moved-from object.
    fp = fixpoint<rational>(3);
    REQUIRE(fp.size() == 3u);
}

TEST_CASE("fixpoint ill founded")
{
    // s = s.
    {
        const auto s = fix<rational>([](const series<rational> &x) { return x; });

        REQUIRE_THROWS_MATCHES(s.head(), fixpoint_error,
                               Message("Ill-founded recursive series definition detected: the evaluation of a "
                                       "coefficient requires the coefficient itself"));

        // The failure is repeatable.
        REQUIRE_THROWS_AS(s.head(), fixpoint_error);
    }

    // s = s + 1.
    {
        const auto s = fix<rational>([](const series<rational> &x) { return x + q(1); });

        REQUIRE_THROWS_AS(s.head(), fixpoint_error);
    }

    // s = cons(1, s) is well founded, s = s*s is not.
    {
        const auto s = fix<rational>([](const series<rational> &x) { return cons(q(1), [x]() { return x; }); });
        REQUIRE(take(s, 4) == qvec({1, 1, 1, 1}));

        const auto t = fix<rational>([](const series<rational> &x) { return x * x; });
        REQUIRE_THROWS_AS(t.head(), fixpoint_error);
    }

    // A definition which reads the placeholder eagerly fails fast.
    REQUIRE_THROWS_MATCHES(fix<rational>([](const series<rational> &x) { return series<rational>(x.head()); }),
                           fixpoint_error, Message("A recursive series definition was read before being bound"));
}

TEST_CASE("fixpoint mutual recursion")
{
    fixpoint<rational> fp(2);

    const auto [s, c] = std::pair{fp.ref(0), fp.ref(1)};

    // Hyperbolic sine and cosine.
    const auto ret = fp.bind({integrate(c), one<rational>() + integrate(s)});

    REQUIRE(take(ret[0], 6) == std::vector{q(0), q(1), q(0), q(1, 6), q(0), q(1, 120)});
    REQUIRE(take(ret[1], 6) == std::vector{q(1), q(0), q(1, 2), q(0), q(1, 24), q(0)});
}

TEST_CASE("fixpoint reclamation")
{
    series<rational> weak, strong;

    {
        fixpoint<rational> fp;

        weak = fp.ref();
        REQUIRE(!weak.is_owning());

        const auto e = fp.bind(one<rational>() + integrate(weak));

        // Tails of an owning handle are owning as well.
        strong = e.tail().tail();
        REQUIRE(strong.is_owning());
    }

    // The owning tail keeps the whole definition alive.
    REQUIRE(take(strong, 3) == std::vector{q(1, 2), q(1, 6), q(1, 24)});
    REQUIRE(weak[4] == q(1, 24));

    strong = series<rational>{};

    // Once the last owner is gone, the non-owning handle dangles.
    REQUIRE_THROWS_MATCHES(weak.head(), fixpoint_error,
                           Message("Cannot read from a recursive series definition which has already been destroyed"));
    REQUIRE_THROWS_AS(weak.tail().head(), fixpoint_error);
}

TEST_CASE("fix double")
{
    const auto e = fix<double>([](const series<double> &x) { return 1. + integrate(x); });

    const auto v = take(e, 4);
    REQUIRE(v[0] == 1.);
    REQUIRE(v[1] == 1.);
    REQUIRE(v[2] == 0.5);
    REQUIRE(v[3] == approximately(1. / 6));
}
