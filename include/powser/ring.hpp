// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef POWSER_RING_HPP
#define POWSER_RING_HPP

#include <concepts>
#include <cstddef>
#include <type_traits>

#include <mp++/rational.hpp>

#include <powser/config.hpp>

POWSER_BEGIN_NAMESPACE

// The exact coefficient ring.
using rational = mppp::rational<1>;

// Capability interface of a coefficient ring, on top of
// the arithmetic and comparison operators. May be specialised
// for types in which 0 and 1 are not constructible from int.
template <typename T>
struct ring_traits {
    static T zero()
    {
        return T(0);
    }
    static T one()
    {
        return T(1);
    }
    static bool is_zero(const T &x)
    {
        return x == zero();
    }
    static bool is_one(const T &x)
    {
        return x == one();
    }
};

template <typename T>
concept coefficient_ring = std::copyable<T> && std::equality_comparable<T> && requires(const T &a, const T &b) {
    { ring_traits<T>::zero() } -> std::convertible_to<T>;
    { ring_traits<T>::one() } -> std::convertible_to<T>;
    { a + b } -> std::convertible_to<T>;
    { -a } -> std::convertible_to<T>;
    { a * b } -> std::convertible_to<T>;
    { a / b } -> std::convertible_to<T>;
};

namespace detail
{

// The coefficient types for which the library is compiled.
template <typename>
struct is_supported_ring : std::false_type {
};

template <>
struct is_supported_ring<rational> : std::true_type {
};

template <>
struct is_supported_ring<double> : std::true_type {
};

template <typename T>
inline constexpr bool is_supported_ring_v = is_supported_ring<T>::value;

// Image of the natural number n in the ring T, i.e., 1 + 1 + ... + 1 (n times).
// Computed via binary doubling so that only ring operations are used.
template <typename T>
T ring_from_natural(std::size_t n)
{
    auto ret = ring_traits<T>::zero();
    auto cur = ring_traits<T>::one();

    while (n != 0u) {
        if (n % 2u == 1u) {
            ret = ret + cur;
        }
        cur = cur + cur;
        n /= 2u;
    }

    return ret;
}

} // namespace detail

template <typename T>
concept supported_ring = coefficient_ring<T> && detail::is_supported_ring_v<T>;

POWSER_END_NAMESPACE

#endif
