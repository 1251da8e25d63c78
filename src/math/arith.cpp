// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <powser/config.hpp>

#include <cstddef>
#include <initializer_list>
#include <type_traits>
#include <utility>
#include <vector>

#include <powser/detail/stream.hpp>
#include <powser/math/arith.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

namespace detail
{

namespace
{

template <typename T>
class sequence_stream final : public stream<T>
{
    const std::vector<T> m_cfs;

public:
    explicit sequence_stream(std::vector<T> cfs) : m_cfs(std::move(cfs)) {}

    [[nodiscard]] T coeff(std::size_t n) const override
    {
        return n < m_cfs.size() ? m_cfs[n] : ring_traits<T>::zero();
    }
};

template <typename T>
class neg_stream final : public memo_stream<T>
{
    const series<T> m_arg;

    [[nodiscard]] T next(std::size_t n) const override
    {
        return -m_arg[n];
    }

public:
    explicit neg_stream(series<T> f) : m_arg(std::move(f)) {}
};

template <typename T>
class scale_stream final : public memo_stream<T>
{
    const T m_c;
    const series<T> m_arg;

    [[nodiscard]] T next(std::size_t n) const override
    {
        return m_c * m_arg[n];
    }

public:
    explicit scale_stream(T c, series<T> f) : m_c(std::move(c)), m_arg(std::move(f)) {}
};

template <typename T>
class add_stream final : public memo_stream<T>
{
    const series<T> m_a, m_b;

    [[nodiscard]] T next(std::size_t n) const override
    {
        return m_a[n] + m_b[n];
    }

public:
    explicit add_stream(series<T> a, series<T> b) : m_a(std::move(a)), m_b(std::move(b)) {}
};

} // namespace

} // namespace detail

template <typename T>
    requires supported_ring<T>
series<T> zero()
{
    return series<T>{};
}

template <typename T>
    requires supported_ring<T>
series<T> one()
{
    return constant(ring_traits<T>::one());
}

template <typename T>
    requires supported_ring<T>
series<T> constant(T c)
{
    return series<T>{std::move(c)};
}

template <typename T>
    requires supported_ring<T>
series<T> identity()
{
    return of_sequence(std::vector<T>{ring_traits<T>::zero(), ring_traits<T>::one()});
}

template <typename T>
    requires supported_ring<T>
series<T> of_sequence(std::vector<T> cfs)
{
    return detail::make_series<detail::sequence_stream<T>>(std::move(cfs));
}

template <typename T>
    requires supported_ring<T>
series<T> of_sequence(std::initializer_list<T> cfs)
{
    return of_sequence(std::vector<T>(cfs));
}

template <typename T>
    requires supported_ring<T>
series<T> neg(series<T> f)
{
    return detail::make_series<detail::neg_stream<T>>(std::move(f));
}

template <typename T>
    requires supported_ring<T>
series<T> scale(std::type_identity_t<T> c, series<T> f)
{
    return detail::make_series<detail::scale_stream<T>>(std::move(c), std::move(f));
}

template <typename T>
    requires supported_ring<T>
series<T> add(series<T> f, series<T> g)
{
    return detail::make_series<detail::add_stream<T>>(std::move(f), std::move(g));
}

template <typename T>
    requires supported_ring<T>
series<T> sub(series<T> f, series<T> g)
{
    return add(std::move(f), neg(std::move(g)));
}

template <typename T>
    requires supported_ring<T>
series<T> operator+(series<T> f)
{
    return f;
}

template <typename T>
    requires supported_ring<T>
series<T> operator-(series<T> f)
{
    return neg(std::move(f));
}

template <typename T>
    requires supported_ring<T>
series<T> operator+(series<T> f, series<T> g)
{
    return add(std::move(f), std::move(g));
}

template <typename T>
    requires supported_ring<T>
series<T> operator+(std::type_identity_t<T> c, series<T> f)
{
    return add(constant(std::move(c)), std::move(f));
}

template <typename T>
    requires supported_ring<T>
series<T> operator+(series<T> f, std::type_identity_t<T> c)
{
    return add(std::move(f), constant(std::move(c)));
}

template <typename T>
    requires supported_ring<T>
series<T> operator-(series<T> f, series<T> g)
{
    return sub(std::move(f), std::move(g));
}

template <typename T>
    requires supported_ring<T>
series<T> operator-(std::type_identity_t<T> c, series<T> f)
{
    return sub(constant(std::move(c)), std::move(f));
}

template <typename T>
    requires supported_ring<T>
series<T> operator-(series<T> f, std::type_identity_t<T> c)
{
    return sub(std::move(f), constant(std::move(c)));
}

// Explicit instantiations.
#define POWSER_ARITH_INST(T)                                                                                           \
    template POWSER_DLL_PUBLIC series<T> zero<T>();                                                                    \
    template POWSER_DLL_PUBLIC series<T> one<T>();                                                                     \
    template POWSER_DLL_PUBLIC series<T> constant<T>(T);                                                               \
    template POWSER_DLL_PUBLIC series<T> identity<T>();                                                                \
    template POWSER_DLL_PUBLIC series<T> of_sequence<T>(std::vector<T>);                                               \
    template POWSER_DLL_PUBLIC series<T> of_sequence<T>(std::initializer_list<T>);                                     \
    template POWSER_DLL_PUBLIC series<T> neg<T>(series<T>);                                                            \
    template POWSER_DLL_PUBLIC series<T> scale<T>(std::type_identity_t<T>, series<T>);                                 \
    template POWSER_DLL_PUBLIC series<T> add<T>(series<T>, series<T>);                                                 \
    template POWSER_DLL_PUBLIC series<T> sub<T>(series<T>, series<T>);                                                 \
    template POWSER_DLL_PUBLIC series<T> operator+ <T>(series<T>);                                                     \
    template POWSER_DLL_PUBLIC series<T> operator- <T>(series<T>);                                                     \
    template POWSER_DLL_PUBLIC series<T> operator+ <T>(series<T>, series<T>);                                          \
    template POWSER_DLL_PUBLIC series<T> operator+ <T>(std::type_identity_t<T>, series<T>);                            \
    template POWSER_DLL_PUBLIC series<T> operator+ <T>(series<T>, std::type_identity_t<T>);                            \
    template POWSER_DLL_PUBLIC series<T> operator- <T>(series<T>, series<T>);                                          \
    template POWSER_DLL_PUBLIC series<T> operator- <T>(std::type_identity_t<T>, series<T>);                            \
    template POWSER_DLL_PUBLIC series<T> operator- <T>(series<T>, std::type_identity_t<T>);

POWSER_ARITH_INST(rational)
POWSER_ARITH_INST(double)

#undef POWSER_ARITH_INST

POWSER_END_NAMESPACE
