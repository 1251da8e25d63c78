// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <powser/config.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <boost/safe_numerics/safe_integer.hpp>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <powser/detail/stream.hpp>
#include <powser/detail/string_conv.hpp>
#include <powser/exceptions.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

namespace detail
{

namespace
{

// The series c + 0*x + 0*x**2 + ...
template <typename T>
class constant_stream final : public stream<T>
{
    const T m_value;

public:
    explicit constant_stream(T c) : m_value(std::move(c)) {}

    [[nodiscard]] T coeff(std::size_t n) const override
    {
        return n == 0u ? m_value : ring_traits<T>::zero();
    }
};

} // namespace

// A head and a lazily-evaluated tail.
//
// Long chains of nested cons nodes are walked iteratively: each node
// keeps a cursor to the position in the chain reached by the last read,
// so that reading the coefficients in order costs O(1) per coefficient
// and never recurses along the chain.
template <typename T>
    requires supported_ring<T>
class cons_stream final : public memo_stream<T>
{
    const T m_head;
    mutable std::mutex m_mutex;
    // NOTE: the thunk is reset after evaluation
    // in order to release whatever it captured.
    mutable std::function<series<T>()> m_thunk;
    mutable std::optional<series<T>> m_tail;
    // The series starting at index m_cursor->first of this series.
    mutable std::optional<std::pair<std::size_t, series<T>>> m_cursor;

    series<T> force() const
    {
        std::function<series<T>()> thunk;

        {
            const std::lock_guard lock(m_mutex);

            if (m_tail) {
                return *m_tail;
            }

            thunk = m_thunk;
        }

        auto ret = [this, &thunk]() {
            const eval_guard eg(&m_thunk, 0);

            return thunk();
        }();

        const std::lock_guard lock(m_mutex);

        if (!m_tail) {
            m_tail.emplace(std::move(ret));
            m_thunk = nullptr;
        }

        return *m_tail;
    }

    // Replace a view with nonzero offset into a cons node with
    // the equivalent view into the node's tail, until the view starts
    // at the head of a node or refers to a stream of another kind.
    static series<T> normalise(series<T> s)
    {
        while (s.m_offset != 0u) {
            const auto ptr = s.get_stream();
            const auto *c = dynamic_cast<const cons_stream *>(ptr.get());
            if (c == nullptr) {
                break;
            }

            auto t = c->force();
            t.m_offset = boost::safe_numerics::safe<std::size_t>(t.m_offset) + (s.m_offset - 1u);
            s = std::move(t);
        }

        return s;
    }

    [[nodiscard]] T next(std::size_t n) const override
    {
        if (n == 0u) {
            return m_head;
        }

        std::optional<std::pair<std::size_t, series<T>>> cur;

        {
            const std::lock_guard lock(m_mutex);

            if (m_cursor && m_cursor->first <= n) {
                cur = m_cursor;
            }
        }

        if (!cur) {
            cur.emplace(1, force());
        }

        auto &[idx, s] = *cur;
        s.m_offset = boost::safe_numerics::safe<std::size_t>(s.m_offset) + (n - idx);
        s = normalise(std::move(s));
        idx = n;

        auto ret = s.head();

        const std::lock_guard lock(m_mutex);

        if (!m_cursor || m_cursor->first < n) {
            m_cursor = std::move(cur);
        }

        return ret;
    }

public:
    explicit cons_stream(T h, std::function<series<T>()> thunk) : m_head(std::move(h)), m_thunk(std::move(thunk)) {}

    // NOTE: the chain of uniquely-owned tails is unlinked
    // iteratively, so that the destruction of a long chain
    // does not recurse.
    ~cons_stream() override
    {
        auto cur = std::move(m_tail);
        m_tail.reset();

        while (cur) {
            const auto *ptr = std::get_if<typename series<T>::stream_ptr>(&cur->m_ptr);
            if (ptr == nullptr || ptr->use_count() != 1) {
                break;
            }

            const auto *c = dynamic_cast<const cons_stream *>(ptr->get());
            if (c == nullptr) {
                break;
            }

            auto tmp = std::move(c->m_tail);
            c->m_tail.reset();
            cur = std::move(tmp);
        }
    }
};

} // namespace detail

template <typename T>
    requires supported_ring<T>
series<T>::series(ptag, std::variant<stream_ptr, weak_stream_ptr> ptr, std::size_t offset)
    : m_ptr(std::move(ptr)), m_offset(offset)
{
}

template <typename T>
    requires supported_ring<T>
series<T>::series() : series(ring_traits<T>::zero())
{
}

template <typename T>
    requires supported_ring<T>
series<T>::series(T c) : series(std::make_shared<const detail::constant_stream<T>>(std::move(c)))
{
}

template <typename T>
    requires supported_ring<T>
series<T>::series(stream_ptr ptr) : m_ptr(std::move(ptr))
{
    if (!std::get<stream_ptr>(m_ptr)) [[unlikely]] {
        throw std::invalid_argument("Cannot construct a series from a null stream");
    }
}

template <typename T>
    requires supported_ring<T>
series<T>::series(const series &) = default;

template <typename T>
    requires supported_ring<T>
series<T>::series(series &&) noexcept = default;

template <typename T>
    requires supported_ring<T>
series<T> &series<T>::operator=(const series &) = default;

template <typename T>
    requires supported_ring<T>
series<T> &series<T>::operator=(series &&) noexcept = default;

template <typename T>
    requires supported_ring<T>
series<T>::~series() = default;

template <typename T>
    requires supported_ring<T>
typename series<T>::stream_ptr series<T>::get_stream() const
{
    if (const auto *ptr = std::get_if<stream_ptr>(&m_ptr)) {
        return *ptr;
    }

    auto ret = std::get<weak_stream_ptr>(m_ptr).lock();

    if (!ret) [[unlikely]] {
        throw fixpoint_error("Cannot read from a recursive series definition which has already been destroyed");
    }

    return ret;
}

template <typename T>
    requires supported_ring<T>
T series<T>::head() const
{
    return get_stream()->coeff(m_offset);
}

template <typename T>
    requires supported_ring<T>
series<T> series<T>::tail() const
{
    return series(ptag{}, m_ptr, boost::safe_numerics::safe<std::size_t>(m_offset) + 1);
}

template <typename T>
    requires supported_ring<T>
T series<T>::operator[](std::size_t n) const
{
    return get_stream()->coeff(boost::safe_numerics::safe<std::size_t>(m_offset) + n);
}

template <typename T>
    requires supported_ring<T>
bool series<T>::is_owning() const noexcept
{
    return std::holds_alternative<stream_ptr>(m_ptr);
}

// Explicit instantiations.
template class series<rational>;
template class series<double>;

template <typename T>
    requires supported_ring<T>
T head(const series<T> &s)
{
    return s.head();
}

template <typename T>
    requires supported_ring<T>
series<T> tail(const series<T> &s)
{
    return s.tail();
}

template <typename T>
    requires supported_ring<T>
series<T> cons(T h, std::type_identity_t<std::function<series<T>()>> thunk)
{
    if (!thunk) [[unlikely]] {
        throw std::invalid_argument("Cannot construct a series from an empty thunk");
    }

    return detail::make_series<detail::cons_stream<T>>(std::move(h), std::move(thunk));
}

template <typename T>
    requires supported_ring<T>
std::string to_string(const series<T> &s, std::size_t n)
{
    std::vector<std::string> cfs;
    cfs.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        cfs.push_back(detail::cf_to_string(s[i]));
    }

    if (cfs.empty()) {
        return "[...]";
    }

    return fmt::format("[{}, ...]", fmt::join(cfs, ", "));
}

template <typename T>
    requires supported_ring<T>
std::ostream &operator<<(std::ostream &os, const series<T> &s)
{
    return os << to_string(s);
}

// Explicit instantiations.
#define POWSER_SERIES_INST(T)                                                                                          \
    template POWSER_DLL_PUBLIC T head<T>(const series<T> &);                                                           \
    template POWSER_DLL_PUBLIC series<T> tail<T>(const series<T> &);                                                   \
    template POWSER_DLL_PUBLIC series<T> cons<T>(T, std::type_identity_t<std::function<series<T>()>>);                 \
    template POWSER_DLL_PUBLIC std::string to_string<T>(const series<T> &, std::size_t);                               \
    template POWSER_DLL_PUBLIC std::ostream &operator<< <T>(std::ostream &, const series<T> &);

POWSER_SERIES_INST(rational)
POWSER_SERIES_INST(double)

#undef POWSER_SERIES_INST

POWSER_END_NAMESPACE
