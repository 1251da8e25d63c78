// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <powser/config.hpp>

#include <utility>

#include <fmt/core.h>

#include <powser/detail/string_conv.hpp>
#include <powser/exceptions.hpp>
#include <powser/math/compose.hpp>
#include <powser/math/mul.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

template <typename T>
    requires supported_ring<T>
series<T> compose(series<T> f, series<T> g)
{
    // NOTE: with a nonzero constant term in g, each coefficient
    // of the composition would depend on infinitely many coefficients of f.
    if (const auto g0 = g.head(); !ring_traits<T>::is_zero(g0)) [[unlikely]] {
        throw unsupported_operation_error(
            fmt::format("Cannot compose with a series whose constant term is nonzero (the constant term is {})",
                        detail::cf_to_string(g0)));
    }

    // f(g) = f_0 + g*tail(f)(g) = f_0 + x*(tail(g)*tail(f)(g)).
    auto f0 = f.head();
    return cons(std::move(f0), [f = std::move(f), g = std::move(g)]() { return mul(g.tail(), compose(f.tail(), g)); });
}

// Explicit instantiations.
template POWSER_DLL_PUBLIC series<rational> compose<rational>(series<rational>, series<rational>);
template POWSER_DLL_PUBLIC series<double> compose<double>(series<double>, series<double>);

POWSER_END_NAMESPACE
