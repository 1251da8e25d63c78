// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

// NOTE: this needs to go first because of the
// SPDLOG_ACTIVE_LEVEL definition.
#include <powser/detail/logging_impl.hpp>

#include <powser/config.hpp>

#include <cstddef>
#include <mutex>
#include <type_traits>
#include <utility>

#include <boost/safe_numerics/safe_integer.hpp>

#include <fmt/core.h>

#include <powser/detail/stream.hpp>
#include <powser/exceptions.hpp>
#include <powser/math/arith.hpp>
#include <powser/math/div.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

namespace detail
{

namespace
{

// Long division. After the cancellation of the common
// factor x**s, the quotient q satisfies
//
// q_n = (a_(s+n) - q_0*b_(s+n) - ... - q_(n-1)*b_(s+1)) / b_s,
//
// i.e., at each step the residual tail(a) - q_n*tail(b) becomes
// the new numerator.
template <typename T>
class div_stream final : public memo_stream<T>
{
    using su_t = boost::safe_numerics::safe<std::size_t>;

    const series<T> m_num, m_den;
    mutable std::once_flag m_shift_flag;
    mutable std::size_t m_shift = 0;

    // Number of common leading zeroes in m_num and m_den.
    std::size_t get_shift() const
    {
        std::call_once(m_shift_flag, [this]() {
            su_t s = 0;
            while (ring_traits<T>::is_zero(m_num[s]) && ring_traits<T>::is_zero(m_den[s])) {
                ++s;
            }

            if (s != 0u) {
                SPDLOG_LOGGER_DEBUG(get_logger(), "series division: cancelled the common factor x**{}",
                                    static_cast<std::size_t>(s));
            }

            m_shift = s;
        });

        return m_shift;
    }

    [[nodiscard]] T next(std::size_t n) const override
    {
        const auto s = get_shift();

        const auto d0 = m_den[s];
        if (ring_traits<T>::is_zero(d0)) [[unlikely]] {
            throw zero_division_error(
                fmt::format("Division by zero detected in a series quotient: after the cancellation of {} common "
                            "leading zero(s), the denominator has a zero constant term while the numerator does not",
                            s));
        }

        auto ret = m_num[su_t(s) + n];
        for (std::size_t k = 0; k < n; ++k) {
            ret = ret + -(this->coeff(k) * m_den[su_t(s) + n - k]);
        }

        return ret / d0;
    }

public:
    explicit div_stream(series<T> a, series<T> b) : m_num(std::move(a)), m_den(std::move(b)) {}
};

} // namespace

} // namespace detail

template <typename T>
    requires supported_ring<T>
series<T> div(series<T> f, series<T> g)
{
    return detail::make_series<detail::div_stream<T>>(std::move(f), std::move(g));
}

template <typename T>
    requires supported_ring<T>
series<T> operator/(series<T> f, series<T> g)
{
    return div(std::move(f), std::move(g));
}

template <typename T>
    requires supported_ring<T>
series<T> operator/(std::type_identity_t<T> c, series<T> f)
{
    return div(constant(std::move(c)), std::move(f));
}

template <typename T>
    requires supported_ring<T>
series<T> operator/(series<T> f, std::type_identity_t<T> c)
{
    return div(std::move(f), constant(std::move(c)));
}

// Explicit instantiations.
#define POWSER_DIV_INST(T)                                                                                             \
    template POWSER_DLL_PUBLIC series<T> div<T>(series<T>, series<T>);                                                 \
    template POWSER_DLL_PUBLIC series<T> operator/ <T>(series<T>, series<T>);                                          \
    template POWSER_DLL_PUBLIC series<T> operator/ <T>(std::type_identity_t<T>, series<T>);                            \
    template POWSER_DLL_PUBLIC series<T> operator/ <T>(series<T>, std::type_identity_t<T>);

POWSER_DIV_INST(rational)
POWSER_DIV_INST(double)

#undef POWSER_DIV_INST

POWSER_END_NAMESPACE
