// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <powser/config.hpp>

#include <cassert>
#include <vector>

#include <powser/fixpoint.hpp>
#include <powser/math/arith.hpp>
#include <powser/math/calculus.hpp>
#include <powser/math/sincos.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

namespace detail
{

namespace
{

// sin and cos are defined together, via the system
//
// sin = integrate(cos),
// cos = 1 - integrate(sin).
template <typename T>
const std::vector<series<T>> &sincos_impl()
{
    static const auto ret = []() {
        fixpoint<T> fp(2);
        const auto s = fp.ref(0);
        const auto c = fp.ref(1);

        return fp.bind(std::vector<series<T>>{integrate(c), one<T>() - integrate(s)});
    }();

    assert(ret.size() == 2u);

    return ret;
}

} // namespace

} // namespace detail

template <typename T>
    requires supported_ring<T>
series<T> sin()
{
    return detail::sincos_impl<T>()[0];
}

template <typename T>
    requires supported_ring<T>
series<T> cos()
{
    return detail::sincos_impl<T>()[1];
}

// Explicit instantiations.
template POWSER_DLL_PUBLIC series<rational> sin<rational>();
template POWSER_DLL_PUBLIC series<double> sin<double>();

template POWSER_DLL_PUBLIC series<rational> cos<rational>();
template POWSER_DLL_PUBLIC series<double> cos<double>();

POWSER_END_NAMESPACE
