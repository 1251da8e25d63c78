// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef POWSER_LOGGING_HPP
#define POWSER_LOGGING_HPP

#include <powser/config.hpp>
#include <powser/detail/visibility.hpp>

POWSER_BEGIN_NAMESPACE

// Severity levels of the library's logger. Debug messages
// are emitted only by debug builds of the library.
enum class log_level { trace, debug, info, warn, err, critical, off };

POWSER_DLL_PUBLIC void set_log_level(log_level);
[[nodiscard]] POWSER_DLL_PUBLIC log_level get_log_level();

POWSER_END_NAMESPACE

#endif
