// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <powser/config.hpp>

#include <string>
#include <type_traits>

#include <fmt/format.h>

#include <powser/detail/string_conv.hpp>
#include <powser/detail/visibility.hpp>
#include <powser/ring.hpp>

POWSER_BEGIN_NAMESPACE

namespace detail
{

template <typename T>
std::string cf_to_string(const T &x)
{
    if constexpr (std::is_same_v<T, rational>) {
        return x.to_string();
    } else {
        return fmt::format("{}", x);
    }
}

// Explicit instantiations.
template POWSER_DLL_PUBLIC std::string cf_to_string<rational>(const rational &);
template POWSER_DLL_PUBLIC std::string cf_to_string<double>(const double &);

} // namespace detail

POWSER_END_NAMESPACE
