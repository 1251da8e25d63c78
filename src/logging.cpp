// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <stdexcept>

#include <fmt/core.h>

#include <powser/config.hpp>
#include <powser/detail/logging_impl.hpp>
#include <powser/logging.hpp>

POWSER_BEGIN_NAMESPACE

namespace detail
{

namespace
{

spdlog::level::level_enum to_spdlog_level(log_level l)
{
    switch (l) {
        case log_level::trace:
            return spdlog::level::trace;
        case log_level::debug:
            return spdlog::level::debug;
        case log_level::info:
            return spdlog::level::info;
        case log_level::warn:
            return spdlog::level::warn;
        case log_level::err:
            return spdlog::level::err;
        case log_level::critical:
            return spdlog::level::critical;
        case log_level::off:
            return spdlog::level::off;
    }

    throw std::invalid_argument(fmt::format("Invalid log level {}", static_cast<int>(l)));
}

} // namespace

} // namespace detail

void set_log_level(log_level l)
{
    detail::get_logger()->set_level(detail::to_spdlog_level(l));
}

log_level get_log_level()
{
    switch (detail::get_logger()->level()) {
        case spdlog::level::trace:
            return log_level::trace;
        case spdlog::level::debug:
            return log_level::debug;
        case spdlog::level::info:
            return log_level::info;
        case spdlog::level::warn:
            return log_level::warn;
        case spdlog::level::err:
            return log_level::err;
        case spdlog::level::critical:
            return log_level::critical;
        default:
            return log_level::off;
    }
}

POWSER_END_NAMESPACE
