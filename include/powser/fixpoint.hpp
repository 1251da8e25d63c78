// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef POWSER_FIXPOINT_HPP
#define POWSER_FIXPOINT_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>
#include <vector>

#include <powser/config.hpp>
#include <powser/detail/fwd_decl.hpp>
#include <powser/detail/visibility.hpp>
#include <powser/ring.hpp>
#include <powser/series.hpp>

POWSER_BEGIN_NAMESPACE

// A group of mutually recursive series definitions.
//
// Usage: the placeholders returned by ref() may be used in the definitions
// of the members of the group, which are then passed all at once to bind().
// bind() returns owning handles to the members. The placeholders must not
// be read before bind() is invoked, otherwise fixpoint_error is thrown.
//
// The references returned by ref() are non-owning. All the members of the
// group share the same lifetime: the group is destroyed as soon as the
// fixpoint object and all the owning handles to its members are gone.
template <typename T>
    requires supported_ring<T>
class POWSER_DLL_PUBLIC_INLINE_CLASS fixpoint
{
    struct impl;
    std::shared_ptr<impl> m_impl;

    impl &get_impl() const;

public:
    explicit fixpoint(std::size_t = 1);
    fixpoint(const fixpoint &) = delete;
    fixpoint(fixpoint &&) noexcept;
    fixpoint &operator=(const fixpoint &) = delete;
    fixpoint &operator=(fixpoint &&) noexcept;
    ~fixpoint();

    // NOTE: all the member functions below throw std::invalid_argument
    // if invoked on a moved-from object.
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool is_bound() const;

    [[nodiscard]] series<T> ref(std::size_t = 0) const;
    [[nodiscard]] std::vector<series<T>> refs() const;

    std::vector<series<T>> bind(std::vector<series<T>>);
    series<T> bind(series<T>);
};

// Prevent implicit instantiations.
extern template class fixpoint<rational>;
extern template class fixpoint<double>;

// Build the series s satisfying s == f(s).
template <typename T>
    requires supported_ring<T>
POWSER_DLL_PUBLIC series<T> fix(const std::type_identity_t<std::function<series<T>(const series<T> &)>> &);

POWSER_END_NAMESPACE

#endif
