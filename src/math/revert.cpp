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
#include <powser/fixpoint.hpp>
#include <powser/math/arith.hpp>
#include <powser/math/compose.hpp>
#include <powser/math/div.hpp>
#include <powser/math/revert.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

template <typename T>
    requires supported_ring<T>
series<T> revert(series<T> f)
{
    if (const auto f0 = f.head(); !ring_traits<T>::is_zero(f0)) [[unlikely]] {
        throw unsupported_operation_error(
            fmt::format("Cannot revert a series whose constant term is nonzero (the constant term is {})",
                        detail::cf_to_string(f0)));
    }

    // The inverse r satisfies f(r) = x, that is, r*tail(f)(r) = x.
    // Thus r = x / tail(f)(r), which is a recursive definition for r
    // (the constant term of r is zero).
    fixpoint<T> fp;
    auto r = fp.ref();

    return fp.bind(cons(ring_traits<T>::zero(),
                        [fs = f.tail(), r = std::move(r)]() { return one<T>() / compose(fs, r); }));
}

// Explicit instantiations.
template POWSER_DLL_PUBLIC series<rational> revert<rational>(series<rational>);
template POWSER_DLL_PUBLIC series<double> revert<double>(series<double>);

POWSER_END_NAMESPACE
