// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <powser/config.hpp>

#include <powser/math/div.hpp>
#include <powser/math/sincos.hpp>
#include <powser/math/tan.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

template <typename T>
    requires supported_ring<T>
series<T> tan()
{
    static const auto ret = sin<T>() / cos<T>();

    return ret;
}

// Explicit instantiations.
template POWSER_DLL_PUBLIC series<rational> tan<rational>();
template POWSER_DLL_PUBLIC series<double> tan<double>();

POWSER_END_NAMESPACE
