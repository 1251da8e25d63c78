// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <powser/config.hpp>

#include <cstddef>
#include <utility>

#include <boost/safe_numerics/safe_integer.hpp>

#include <powser/detail/stream.hpp>
#include <powser/math/calculus.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

namespace detail
{

namespace
{

template <typename T>
class diff_stream final : public memo_stream<T>
{
    const series<T> m_arg;

    [[nodiscard]] T next(std::size_t n) const override
    {
        const std::size_t np1 = boost::safe_numerics::safe<std::size_t>(n) + 1;

        return ring_from_natural<T>(np1) * m_arg[np1];
    }

public:
    explicit diff_stream(series<T> f) : m_arg(std::move(f)) {}
};

template <typename T>
class integrate_stream final : public memo_stream<T>
{
    const series<T> m_arg;

    [[nodiscard]] T next(std::size_t n) const override
    {
        if (n == 0u) {
            return ring_traits<T>::zero();
        }

        return m_arg[n - 1u] / ring_from_natural<T>(n);
    }

public:
    explicit integrate_stream(series<T> f) : m_arg(std::move(f)) {}
};

} // namespace

} // namespace detail

template <typename T>
    requires supported_ring<T>
series<T> diff(series<T> f)
{
    return detail::make_series<detail::diff_stream<T>>(std::move(f));
}

template <typename T>
    requires supported_ring<T>
series<T> integrate(series<T> f)
{
    return detail::make_series<detail::integrate_stream<T>>(std::move(f));
}

// Explicit instantiations.
template POWSER_DLL_PUBLIC series<rational> diff<rational>(series<rational>);
template POWSER_DLL_PUBLIC series<double> diff<double>(series<double>);

template POWSER_DLL_PUBLIC series<rational> integrate<rational>(series<rational>);
template POWSER_DLL_PUBLIC series<double> integrate<double>(series<double>);

POWSER_END_NAMESPACE
