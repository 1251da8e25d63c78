// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef POWSER_MATH_REVERT_HPP
#define POWSER_MATH_REVERT_HPP

#include <powser/config.hpp>
#include <powser/detail/visibility.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

// Compositional inverse r of f, i.e., compose(f, r) == x.
// The constant term of f must be zero.
template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> revert(series<T>);

POWSER_END_NAMESPACE

#endif
