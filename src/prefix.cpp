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
#include <cstdint>
#include <type_traits>
#include <vector>

#include <boost/numeric/conversion/cast.hpp>

#include <powser/prefix.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

template <typename T>
    requires supported_ring<T>
std::vector<T> take(const series<T> &s, std::int64_t n)
{
    if (n <= 0) {
        return {};
    }

    spdlog::stopwatch sw;

    const auto size = boost::numeric_cast<std::size_t>(n);

    std::vector<T> ret;
    ret.reserve(size);
    for (std::size_t i = 0; i < size; ++i) {
        ret.push_back(s[i]);
    }

    detail::get_logger()->trace("take() runtime for {} coefficient(s): {}", size, sw);

    return ret;
}

template <typename T>
    requires supported_ring<T>
T eval(const series<T> &s, std::int64_t n, const std::type_identity_t<T> &x)
{
    const auto cfs = take(s, n);

    // Horner's scheme.
    auto ret = ring_traits<T>::zero();
    for (auto it = cfs.rbegin(); it != cfs.rend(); ++it) {
        ret = *it + x * ret;
    }

    return ret;
}

// Explicit instantiations.
template POWSER_DLL_PUBLIC std::vector<rational> take<rational>(const series<rational> &, std::int64_t);
template POWSER_DLL_PUBLIC std::vector<double> take<double>(const series<double> &, std::int64_t);

template POWSER_DLL_PUBLIC rational eval<rational>(const series<rational> &, std::int64_t,
                                                   const std::type_identity_t<rational> &);
template POWSER_DLL_PUBLIC double eval<double>(const series<double> &, std::int64_t,
                                               const std::type_identity_t<double> &);

POWSER_END_NAMESPACE
