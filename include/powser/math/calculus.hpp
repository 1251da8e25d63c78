// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef POWSER_MATH_CALCULUS_HPP
#define POWSER_MATH_CALCULUS_HPP

#include <powser/config.hpp>
#include <powser/detail/visibility.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

// Derivative with respect to x.
template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> diff(series<T>);

// Antiderivative with respect to x, with zero constant term.
//
// NOTE: the head of the result is available without reading the argument,
// which allows to use integrate() in recursive definitions.
template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> integrate(series<T>);

POWSER_END_NAMESPACE

#endif
