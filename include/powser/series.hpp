// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef POWSER_SERIES_HPP
#define POWSER_SERIES_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <powser/config.hpp>
#include <powser/detail/fwd_decl.hpp>
#include <powser/detail/stream.hpp>
#include <powser/detail/visibility.hpp>
#include <powser/ring.hpp>

POWSER_BEGIN_NAMESPACE

// Formal power series a0 + a1*x + a2*x**2 + ...
//
// A series is a lightweight handle to a lazily-computed and memoized
// sequence of coefficients, plus an offset into it. Handles are either
// owning (the usual case) or non-owning. Non-owning handles are created
// only by fixpoint::ref(), and they are used to refer to a recursive
// definition from within the definition itself without creating reference
// cycles.
template <typename T>
    requires supported_ring<T>
class POWSER_DLL_PUBLIC_INLINE_CLASS series
{
public:
    using value_type = T;
    using stream_ptr = std::shared_ptr<const detail::stream<T>>;
    using weak_stream_ptr = std::weak_ptr<const detail::stream<T>>;

private:
    std::variant<stream_ptr, weak_stream_ptr> m_ptr;
    std::size_t m_offset = 0;

    struct ptag {
    };
    explicit series(ptag, std::variant<stream_ptr, weak_stream_ptr>, std::size_t);

    [[nodiscard]] stream_ptr get_stream() const;

    template <typename U>
        requires supported_ring<U>
    friend class fixpoint;

    template <typename U>
        requires supported_ring<U>
    friend class detail::cons_stream;

public:
    // The zero series.
    series();
    // Constant series.
    explicit series(T);
    explicit series(stream_ptr);
    series(const series &);
    series(series &&) noexcept;
    series &operator=(const series &);
    series &operator=(series &&) noexcept;
    ~series();

    [[nodiscard]] T head() const;
    [[nodiscard]] series tail() const;
    [[nodiscard]] T operator[](std::size_t) const;

    [[nodiscard]] bool is_owning() const noexcept;
};

// Prevent implicit instantiations.
extern template class series<rational>;
extern template class series<double>;

namespace detail
{

// Create a series from a newly-allocated stream of type S.
template <typename S, typename... Args>
inline series<typename S::value_type> make_series(Args &&...args)
{
    return series<typename S::value_type>(std::make_shared<const S>(std::forward<Args>(args)...));
}

} // namespace detail

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC T head(const series<T> &);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> tail(const series<T> &);

// Construct the series with the given head and whose tail is produced
// by the given thunk. The thunk is invoked at most once, the first time
// a coefficient beyond the head is requested.
template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> cons(T, std::type_identity_t<std::function<series<T>()>>);

// Render the first n coefficients of a series, followed by a continuation marker.
template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC std::string to_string(const series<T> &, std::size_t = 3);

template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC std::ostream &operator<<(std::ostream &, const series<T> &);

POWSER_END_NAMESPACE

// fmt formatter for series, implemented
// on top of the streaming operator.
namespace fmt
{

template <typename T>
struct formatter<powser::series<T>> : fmt::ostream_formatter {
};

} // namespace fmt

#endif
