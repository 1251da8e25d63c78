// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef POWSER_EXCEPTIONS_HPP
#define POWSER_EXCEPTIONS_HPP

#include <stdexcept>

#include <powser/config.hpp>
#include <powser/detail/visibility.hpp>

POWSER_BEGIN_NAMESPACE

// Exception to signal that an operation is not defined for the
// supplied arguments (e.g., composition with a series whose constant
// term is nonzero).
struct POWSER_DLL_PUBLIC_INLINE_CLASS unsupported_operation_error final : std::domain_error {
    using std::domain_error::domain_error;
};

// Exception to signal division by zero.
struct POWSER_DLL_PUBLIC_INLINE_CLASS zero_division_error final : std::domain_error {
    using std::domain_error::domain_error;
};

// Exception to signal the misuse of a recursive series definition:
// a placeholder read before being bound, a group bound twice,
// a coefficient depending on itself.
struct POWSER_DLL_PUBLIC_INLINE_CLASS fixpoint_error final : std::logic_error {
    using std::logic_error::logic_error;
};

POWSER_END_NAMESPACE

#endif
