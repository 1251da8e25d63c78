// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef POWSER_PREFIX_HPP
#define POWSER_PREFIX_HPP

#include <cstdint>
#include <type_traits>
#include <vector>

#include <powser/config.hpp>
#include <powser/detail/visibility.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

// The first n coefficients of a series. A non-positive n
// results in an empty vector.
template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC std::vector<T> take(const series<T> &, std::int64_t);

// Evaluate the polynomial formed by the first n terms of a series at x.
template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC T eval(const series<T> &, std::int64_t, const std::type_identity_t<T> &);

POWSER_END_NAMESPACE

#endif
