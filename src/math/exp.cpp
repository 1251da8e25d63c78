// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <powser/config.hpp>

#include <powser/fixpoint.hpp>
#include <powser/math/arith.hpp>
#include <powser/math/calculus.hpp>
#include <powser/math/exp.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

// NOTE: exp is the fixed point of f -> 1 + integrate(f). The coefficients
// are memoized for the lifetime of the program.
template <typename T>
    requires supported_ring<T>
series<T> exp()
{
    static const auto ret = fix<T>([](const series<T> &e) { return one<T>() + integrate(e); });

    return ret;
}

// Explicit instantiations.
template POWSER_DLL_PUBLIC series<rational> exp<rational>();
template POWSER_DLL_PUBLIC series<double> exp<double>();

POWSER_END_NAMESPACE
