// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <powser/config.hpp>

#include <cstddef>
#include <type_traits>
#include <utility>

#include <powser/detail/stream.hpp>
#include <powser/math/arith.hpp>
#include <powser/math/mul.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

namespace detail
{

namespace
{

// NOTE: the coefficient at index n is the convolution
//
// c_n = a_0*b_n + a_1*b_(n-1) + ... + a_n*b_0,
//
// which is what the corecursive definition
//
// a*b = a_0*b_0 + x*(a_0*tail(b) + tail(a)*b)
//
// produces once unrolled. Thanks to the memoization of
// the arguments, computing the first n coefficients of
// the product requires O(n**2) ring operations.
template <typename T>
class mul_stream final : public memo_stream<T>
{
    const series<T> m_a, m_b;

    [[nodiscard]] T next(std::size_t n) const override
    {
        auto ret = m_a[0] * m_b[n];
        for (std::size_t k = 1; k <= n; ++k) {
            ret = ret + m_a[k] * m_b[n - k];
        }

        return ret;
    }

public:
    explicit mul_stream(series<T> a, series<T> b) : m_a(std::move(a)), m_b(std::move(b)) {}
};

} // namespace

} // namespace detail

template <typename T>
    requires supported_ring<T>
series<T> mul(series<T> f, series<T> g)
{
    return detail::make_series<detail::mul_stream<T>>(std::move(f), std::move(g));
}

template <typename T>
    requires supported_ring<T>
series<T> operator*(series<T> f, series<T> g)
{
    return mul(std::move(f), std::move(g));
}

template <typename T>
    requires supported_ring<T>
series<T> operator*(std::type_identity_t<T> c, series<T> f)
{
    return mul(constant(std::move(c)), std::move(f));
}

template <typename T>
    requires supported_ring<T>
series<T> operator*(series<T> f, std::type_identity_t<T> c)
{
    return mul(std::move(f), constant(std::move(c)));
}

// Explicit instantiations.
#define POWSER_MUL_INST(T)                                                                                             \
    template POWSER_DLL_PUBLIC series<T> mul<T>(series<T>, series<T>);                                                 \
    template POWSER_DLL_PUBLIC series<T> operator* <T>(series<T>, series<T>);                                          \
    template POWSER_DLL_PUBLIC series<T> operator* <T>(std::type_identity_t<T>, series<T>);                            \
    template POWSER_DLL_PUBLIC series<T> operator* <T>(series<T>, std::type_identity_t<T>);

POWSER_MUL_INST(rational)
POWSER_MUL_INST(double)

#undef POWSER_MUL_INST

POWSER_END_NAMESPACE
