// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef POWSER_POWSER_HPP
#define POWSER_POWSER_HPP

#include <powser/exceptions.hpp>
#include <powser/fixpoint.hpp>
#include <powser/logging.hpp>
#include <powser/math.hpp>
#include <powser/prefix.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

#endif
