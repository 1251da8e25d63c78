// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <powser/config.hpp>

#include <cassert>
#include <cstddef>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

#include <powser/detail/stream.hpp>
#include <powser/exceptions.hpp>
#include <powser/ring.hpp>

POWSER_BEGIN_NAMESPACE

namespace detail
{

namespace
{

// The lazy values currently being evaluated on this thread.
thread_local std::set<std::pair<const void *, std::size_t>> eval_set;

} // namespace

eval_guard::eval_guard(const void *ptr, std::size_t idx) : m_ptr(ptr), m_idx(idx)
{
    if (!eval_set.emplace(m_ptr, m_idx).second) [[unlikely]] {
        throw fixpoint_error("Ill-founded recursive series definition detected: the evaluation of a coefficient "
                             "requires the coefficient itself");
    }
}

eval_guard::~eval_guard()
{
    [[maybe_unused]] const auto n_erased = eval_set.erase({m_ptr, m_idx});
    assert(n_erased == 1u);
}

template <typename T>
    requires supported_ring<T>
stream<T>::stream() = default;

template <typename T>
    requires supported_ring<T>
stream<T>::~stream() = default;

template <typename T>
    requires supported_ring<T>
memo_stream<T>::memo_stream() = default;

template <typename T>
    requires supported_ring<T>
memo_stream<T>::~memo_stream() = default;

template <typename T>
    requires supported_ring<T>
T memo_stream<T>::coeff(std::size_t n) const
{
    while (true) {
        std::size_t idx = 0;

        {
            const std::lock_guard lock(m_mutex);

            if (n < m_cache.size()) {
                return m_cache[n];
            }

            idx = m_cache.size();
        }

        auto cf = [this, idx]() {
            const eval_guard eg(this, idx);

            return next(idx);
        }();

        const std::lock_guard lock(m_mutex);

        // NOTE: another thread may have stored the
        // coefficient in the meantime.
        if (m_cache.size() == idx) {
            m_cache.push_back(std::move(cf));
        }
    }
}

template <typename T>
    requires supported_ring<T>
std::size_t memo_stream<T>::get_n_cached() const
{
    const std::lock_guard lock(m_mutex);

    return m_cache.size();
}

// Explicit instantiations.
template class stream<rational>;
template class stream<double>;

template class memo_stream<rational>;
template class memo_stream<double>;

} // namespace detail

POWSER_END_NAMESPACE
