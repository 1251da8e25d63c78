// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

// NOTE: this needs to go first because of the
// SPDLOG_ACTIVE_LEVEL definition.
#include <powser/detail/logging_impl.hpp>

#include <powser/config.hpp>

#include <utility>

#include <fmt/core.h>

#include <powser/detail/string_conv.hpp>
#include <powser/exceptions.hpp>
#include <powser/fixpoint.hpp>
#include <powser/math/arith.hpp>
#include <powser/math/calculus.hpp>
#include <powser/math/div.hpp>
#include <powser/math/sqrt.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

template <typename T>
    requires supported_ring<T>
series<T> sqrt(series<T> f)
{
    const auto f0 = f.head();

    if (ring_traits<T>::is_zero(f0)) {
        // sqrt(x**2 * g) = x * sqrt(g). Any other
        // odd valuation has no square root.
        if (const auto f1 = f[1]; !ring_traits<T>::is_zero(f1)) [[unlikely]] {
            throw unsupported_operation_error(
                fmt::format("Cannot compute the square root of a series with a zero constant term and a nonzero "
                            "linear term (the linear term is {})",
                            detail::cf_to_string(f1)));
        }

        SPDLOG_LOGGER_DEBUG(detail::get_logger(), "series square root: extracting the factor x**2");

        return cons(ring_traits<T>::zero(), [ftt = f.tail().tail()]() { return sqrt(ftt); });
    }

    if (ring_traits<T>::is_one(f0)) {
        // From q**2 = f we have 2*q*q' = f', so that
        // q = 1 + integrate(f' / (2*q)).
        return fix<T>([fp = diff(std::move(f))](const series<T> &q) { return one<T>() + integrate(fp / (q + q)); });
    }

    throw unsupported_operation_error(
        fmt::format("Cannot compute the square root of a series whose constant term ({}) is neither zero nor one",
                    detail::cf_to_string(f0)));
}

// Explicit instantiations.
template POWSER_DLL_PUBLIC series<rational> sqrt<rational>(series<rational>);
template POWSER_DLL_PUBLIC series<double> sqrt<double>(series<double>);

POWSER_END_NAMESPACE
