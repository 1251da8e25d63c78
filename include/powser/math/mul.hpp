// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef POWSER_MATH_MUL_HPP
#define POWSER_MATH_MUL_HPP

#include <type_traits>

#include <powser/config.hpp>
#include <powser/detail/visibility.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

// Cauchy product.
template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> mul(series<T>, series<T>);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> operator*(series<T>, series<T>);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> operator*(std::type_identity_t<T>, series<T>);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> operator*(series<T>, std::type_identity_t<T>);

POWSER_END_NAMESPACE

#endif
