// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef POWSER_DETAIL_STREAM_HPP
#define POWSER_DETAIL_STREAM_HPP

#include <cstddef>
#include <mutex>
#include <vector>

#include <powser/config.hpp>
#include <powser/detail/fwd_decl.hpp>
#include <powser/detail/visibility.hpp>
#include <powser/ring.hpp>

POWSER_BEGIN_NAMESPACE

namespace detail
{

// Base class of the (conceptually infinite) coefficient sequences
// referenced by series handles.
template <typename T>
    requires supported_ring<T>
class POWSER_DLL_PUBLIC_INLINE_CLASS stream
{
public:
    using value_type = T;

    stream();
    stream(const stream &) = delete;
    stream(stream &&) = delete;
    stream &operator=(const stream &) = delete;
    stream &operator=(stream &&) = delete;
    virtual ~stream();

    [[nodiscard]] virtual T coeff(std::size_t) const = 0;
};

// A stream which computes its coefficients in order and caches them.
//
// NOTE: the mutex is never held while a coefficient is being computed,
// thus concurrent readers may end up computing the same coefficient. Only
// the first result is stored.
template <typename T>
    requires supported_ring<T>
class POWSER_DLL_PUBLIC_INLINE_CLASS memo_stream : public stream<T>
{
    mutable std::mutex m_mutex;
    mutable std::vector<T> m_cache;

    // Compute the coefficient at index n. When this is invoked, all
    // the coefficients at indices less than n are already in the cache.
    [[nodiscard]] virtual T next(std::size_t) const = 0;

public:
    memo_stream();
    ~memo_stream() override;

    [[nodiscard]] T coeff(std::size_t) const final;
    [[nodiscard]] std::size_t get_n_cached() const;
};

// RAII helper to flag the evaluation of the lazy value identified by (ptr, idx)
// as in progress on the current thread. The constructor throws if the evaluation
// is already in progress, which signals an ill-founded recursive definition.
class POWSER_DLL_PUBLIC eval_guard
{
    const void *m_ptr;
    std::size_t m_idx;

public:
    explicit eval_guard(const void *, std::size_t);
    ~eval_guard();

    eval_guard(const eval_guard &) = delete;
    eval_guard(eval_guard &&) = delete;
    eval_guard &operator=(const eval_guard &) = delete;
    eval_guard &operator=(eval_guard &&) = delete;
};

// Prevent implicit instantiations.
extern template class stream<rational>;
extern template class stream<double>;

extern template class memo_stream<rational>;
extern template class memo_stream<double>;

} // namespace detail

POWSER_END_NAMESPACE

#endif
