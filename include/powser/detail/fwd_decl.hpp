// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef POWSER_DETAIL_FWD_DECL_HPP
#define POWSER_DETAIL_FWD_DECL_HPP

#include <powser/config.hpp>
#include <powser/ring.hpp>

POWSER_BEGIN_NAMESPACE

// Fwd declaration of the public classes.
template <typename T>
    requires supported_ring<T>
class series;

template <typename T>
    requires supported_ring<T>
class fixpoint;

namespace detail
{

template <typename T>
    requires supported_ring<T>
class stream;

template <typename T>
    requires supported_ring<T>
class memo_stream;

template <typename T>
    requires supported_ring<T>
class cons_stream;

} // namespace detail

POWSER_END_NAMESPACE

#endif
