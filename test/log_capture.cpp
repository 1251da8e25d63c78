// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <powser/logging.hpp>

#include "log_capture.hpp"

namespace powser_test
{

struct log_capture::impl {
    std::shared_ptr<spdlog::logger> logger;
    std::vector<spdlog::sink_ptr> orig_sinks;
    powser::log_level orig_level = powser::log_level::info;
    std::ostringstream oss;
};

log_capture::log_capture(powser::log_level l) : m_impl(std::make_unique<impl>())
{
    // NOTE: querying the level creates the logger if needed.
    m_impl->orig_level = powser::get_log_level();

    m_impl->logger = spdlog::get("powser");
    if (!m_impl->logger) {
        throw std::runtime_error("The powser logger has not been registered");
    }

    auto &sinks = m_impl->logger->sinks();
    m_impl->orig_sinks = std::move(sinks);
    sinks.clear();
    sinks.push_back(std::make_shared<spdlog::sinks::ostream_sink_mt>(m_impl->oss));

    powser::set_log_level(l);
}

log_capture::~log_capture()
{
    m_impl->logger->flush();
    m_impl->logger->sinks() = std::move(m_impl->orig_sinks);

    powser::set_log_level(m_impl->orig_level);
}

std::string log_capture::str() const
{
    m_impl->logger->flush();

    return m_impl->oss.str();
}

} // namespace powser_test
