// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef POWSER_MATH_ARITH_HPP
#define POWSER_MATH_ARITH_HPP

#include <initializer_list>
#include <type_traits>
#include <vector>

#include <powser/config.hpp>
#include <powser/detail/visibility.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> zero();

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> one();

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> constant(T);

// The series x.
template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> identity();

// Series with the given leading coefficients, followed by zeroes.
template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> of_sequence(std::vector<T>);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> of_sequence(std::initializer_list<T>);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> neg(series<T>);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> scale(std::type_identity_t<T>, series<T>);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> add(series<T>, series<T>);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> sub(series<T>, series<T>);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> operator+(series<T>);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> operator-(series<T>);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> operator+(series<T>, series<T>);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> operator+(std::type_identity_t<T>, series<T>);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> operator+(series<T>, std::type_identity_t<T>);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> operator-(series<T>, series<T>);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> operator-(std::type_identity_t<T>, series<T>);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> operator-(series<T>, std::type_identity_t<T>);

POWSER_END_NAMESPACE

#endif
