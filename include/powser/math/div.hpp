// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef POWSER_MATH_DIV_HPP
#define POWSER_MATH_DIV_HPP

#include <type_traits>

#include <powser/config.hpp>
#include <powser/detail/visibility.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

// Quotient of two series.
//
// The common leading zeroes of numerator and denominator are cancelled first.
// If, after the cancellation, the leading coefficient of the denominator is zero,
// zero_division_error is thrown when the first coefficient of the quotient
// is requested.
//
// NOTE: if both arguments are zero from some index onwards (e.g., div(zero, zero)),
// the cancellation never terminates.
template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> div(series<T>, series<T>);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> operator/(series<T>, series<T>);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> operator/(std::type_identity_t<T>, series<T>);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> operator/(series<T>, std::type_identity_t<T>);

POWSER_END_NAMESPACE

#endif
