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

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <powser/config.hpp>

POWSER_BEGIN_NAMESPACE

namespace detail
{

namespace
{

std::shared_ptr<spdlog::logger> make_logger()
{
    // NOTE: the logger may already exist if the user
    // registered one under the same name.
    if (auto ret = spdlog::get(logger_name)) {
        return ret;
    }

    auto ret = spdlog::stderr_color_mt(logger_name);
    ret->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    ret->set_level(spdlog::level::info);

    return ret;
}

} // namespace

spdlog::logger *get_logger()
{
    static const auto ret = make_logger();

    return ret.get();
}

} // namespace detail

POWSER_END_NAMESPACE
