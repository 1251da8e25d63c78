// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <powser/config.hpp>

#include <cstdint>
#include <utility>

#include <fmt/core.h>

#include <powser/exceptions.hpp>
#include <powser/math/arith.hpp>
#include <powser/math/mul.hpp>
#include <powser/math/pow.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

template <typename T>
    requires supported_ring<T>
series<T> pow(series<T> f, std::int64_t n)
{
    if (n < 0) [[unlikely]] {
        throw unsupported_operation_error(
            fmt::format("Cannot raise a series to the negative power {}: only natural exponents are supported", n));
    }

    // pow(f, n) = f * pow(f, n - 1).
    auto ret = one<T>();
    for (std::int64_t i = 0; i < n; ++i) {
        ret = mul(f, std::move(ret));
    }

    return ret;
}

// Explicit instantiations.
template POWSER_DLL_PUBLIC series<rational> pow<rational>(series<rational>, std::int64_t);
template POWSER_DLL_PUBLIC series<double> pow<double>(series<double>, std::int64_t);

POWSER_END_NAMESPACE
