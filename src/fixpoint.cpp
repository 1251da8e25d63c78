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

#include <powser/config.hpp>

#include <cassert>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include <powser/detail/stream.hpp>
#include <powser/exceptions.hpp>
#include <powser/fixpoint.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

namespace detail
{

// Placeholder forwarding to the series it is eventually bound to.
template <typename T>
class forward_stream final : public stream<T>
{
    mutable std::mutex m_mutex;
    std::optional<series<T>> m_target;

public:
    forward_stream() = default;

    void bind(series<T> s)
    {
        const std::lock_guard lock(m_mutex);

        assert(!m_target);
        m_target.emplace(std::move(s));
    }

    [[nodiscard]] T coeff(std::size_t n) const override
    {
        std::optional<series<T>> target;

        {
            const std::lock_guard lock(m_mutex);
            target = m_target;
        }

        if (!target) [[unlikely]] {
            throw fixpoint_error("A recursive series definition was read before being bound");
        }

        // NOTE: this catches definitions of the form s = s.
        const eval_guard eg(this, n);

        return (*target)[n];
    }
};

} // namespace detail

template <typename T>
    requires supported_ring<T>
struct fixpoint<T>::impl {
    std::mutex m_mutex;
    bool m_bound = false;
    std::vector<std::unique_ptr<detail::forward_stream<T>>> m_nodes;
};

template <typename T>
    requires supported_ring<T>
fixpoint<T>::fixpoint(std::size_t n) : m_impl(std::make_shared<impl>())
{
    if (n == 0u) [[unlikely]] {
        throw std::invalid_argument("A recursive series definition must have at least one member");
    }

    m_impl->m_nodes.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        m_impl->m_nodes.push_back(std::make_unique<detail::forward_stream<T>>());
    }
}

template <typename T>
    requires supported_ring<T>
fixpoint<T>::fixpoint(fixpoint &&) noexcept = default;

template <typename T>
    requires supported_ring<T>
fixpoint<T> &fixpoint<T>::operator=(fixpoint &&) noexcept = default;

template <typename T>
    requires supported_ring<T>
fixpoint<T>::~fixpoint() = default;

template <typename T>
    requires supported_ring<T>
typename fixpoint<T>::impl &fixpoint<T>::get_impl() const
{
    if (!m_impl) [[unlikely]] {
        throw std::invalid_argument("Cannot use a recursive series definition which has been moved from");
    }

    return *m_impl;
}

template <typename T>
    requires supported_ring<T>
std::size_t fixpoint<T>::size() const
{
    return get_impl().m_nodes.size();
}

template <typename T>
    requires supported_ring<T>
bool fixpoint<T>::is_bound() const
{
    auto &im = get_impl();

    const std::lock_guard lock(im.m_mutex);

    return im.m_bound;
}

template <typename T>
    requires supported_ring<T>
series<T> fixpoint<T>::ref(std::size_t i) const
{
    if (i >= size()) [[unlikely]] {
        throw std::invalid_argument(fmt::format(
            "Cannot fetch the member at index {} of a recursive series definition with only {} member(s)", i, size()));
    }

    // NOTE: the aliasing constructor ties the lifetime of the
    // placeholder to the lifetime of the whole group.
    const typename series<T>::stream_ptr ptr(m_impl, get_impl().m_nodes[i].get());

    return series<T>(typename series<T>::ptag{}, typename series<T>::weak_stream_ptr(ptr), 0);
}

template <typename T>
    requires supported_ring<T>
std::vector<series<T>> fixpoint<T>::refs() const
{
    std::vector<series<T>> ret;
    ret.reserve(size());
    for (std::size_t i = 0; i < size(); ++i) {
        ret.push_back(ref(i));
    }

    return ret;
}

template <typename T>
    requires supported_ring<T>
std::vector<series<T>> fixpoint<T>::bind(std::vector<series<T>> defs)
{
    const std::lock_guard lock(get_impl().m_mutex);

    if (m_impl->m_bound) [[unlikely]] {
        throw fixpoint_error("A recursive series definition cannot be bound more than once");
    }

    if (defs.size() != size()) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("Invalid number of definitions passed to the bind() function of a recursive series "
                        "definition: {} were expected, but {} were provided instead",
                        size(), defs.size()));
    }

    std::vector<series<T>> ret;
    ret.reserve(size());
    for (std::size_t i = 0; i < size(); ++i) {
        m_impl->m_nodes[i]->bind(std::move(defs[i]));
        ret.emplace_back(typename series<T>::stream_ptr(m_impl, m_impl->m_nodes[i].get()));
    }

    m_impl->m_bound = true;

    SPDLOG_LOGGER_DEBUG(detail::get_logger(), "recursive series definition with {} member(s) bound", size());

    return ret;
}

template <typename T>
    requires supported_ring<T>
series<T> fixpoint<T>::bind(series<T> def)
{
    if (size() != 1u) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("A single definition can be bound only to a recursive series definition with one member, "
                        "but this recursive series definition has {} members",
                        size()));
    }

    std::vector<series<T>> defs;
    defs.push_back(std::move(def));

    return bind(std::move(defs))[0];
}

// Explicit instantiations.
template class fixpoint<rational>;
template class fixpoint<double>;

template <typename T>
    requires supported_ring<T>
series<T> fix(const std::type_identity_t<std::function<series<T>(const series<T> &)>> &f)
{
    fixpoint<T> fp;

    return fp.bind(f(fp.ref()));
}

template POWSER_DLL_PUBLIC series<rational> fix<rational>(
    const std::type_identity_t<std::function<series<rational>(const series<rational> &)>> &);
template POWSER_DLL_PUBLIC series<double>
fix<double>(const std::type_identity_t<std::function<series<double>(const series<double> &)>> &);

POWSER_END_NAMESPACE
