// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef POWSER_DETAIL_STRING_CONV_HPP
#define POWSER_DETAIL_STRING_CONV_HPP

#include <string>

#include <powser/config.hpp>
#include <powser/detail/visibility.hpp>

POWSER_BEGIN_NAMESPACE

namespace detail
{

// Small helper to convert a coefficient to string. There are no
// guarantees on the output format beyond readability: this exists
// for display and logging purposes only.
template <typename T>
POWSER_DLL_PUBLIC std::string cf_to_string(const T &);

} // namespace detail

POWSER_END_NAMESPACE

#endif
