// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef POWSER_DETAIL_LOGGING_IMPL_HPP
#define POWSER_DETAIL_LOGGING_IMPL_HPP

// NOTE: debug messages are compiled in only in debug builds,
// the SPDLOG_LOGGER_DEBUG() calls expand to nothing otherwise.
// This header must be included before any spdlog header.
#if !defined(NDEBUG)

#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG

#endif

#include <spdlog/spdlog.h>
#include <spdlog/stopwatch.h>

#include <powser/config.hpp>

POWSER_BEGIN_NAMESPACE

namespace detail
{

// Name under which the logger is registered with spdlog.
inline constexpr const char *logger_name = "powser";

// The library's logger, created on first use.
spdlog::logger *get_logger();

} // namespace detail

POWSER_END_NAMESPACE

#endif
