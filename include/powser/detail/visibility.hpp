// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef POWSER_DETAIL_VISIBILITY_HPP
#define POWSER_DETAIL_VISIBILITY_HPP

#include <powser/config.hpp>

// Convenience macros for setting the visibility of entities
// when building/using the shared library. Mostly inspired by:
// https://gcc.gnu.org/wiki/Visibility
// We check first for Windows, where we assume every compiler
// knows dllexport/dllimport. On other platforms, we use the GCC-like
// syntax for GCC, clang and ICC. Otherwise, we leave the definitions
// empty.
#if defined(_WIN32) || defined(__CYGWIN__)

#if defined(powser_EXPORTS)

#define POWSER_DLL_PUBLIC __declspec(dllexport)

#elif defined(POWSER_STATIC_BUILD)

#define POWSER_DLL_PUBLIC

#else

#define POWSER_DLL_PUBLIC __declspec(dllimport)

#endif

#define POWSER_DLL_LOCAL

#elif defined(__clang__) || defined(__GNUC__) || defined(__INTEL_COMPILER)

#define POWSER_DLL_PUBLIC __attribute__((visibility("default")))
#define POWSER_DLL_LOCAL __attribute__((visibility("hidden")))

#else

#define POWSER_DLL_PUBLIC
#define POWSER_DLL_LOCAL

#endif

// NOTE: it seems like on Windows using dllimport/dllexport on inline functions
// (including class member functions defined in the class body) is problematic:
// https://stackoverflow.com/questions/8876279/c-inline-functions-with-dllimport-dllexport
// For class templates with explicit instantiations in the library we mark the
// class as public only on non-Windows platforms.
#if defined(_WIN32) || defined(__CYGWIN__)

#define POWSER_DLL_PUBLIC_INLINE_CLASS

#else

#define POWSER_DLL_PUBLIC_INLINE_CLASS POWSER_DLL_PUBLIC

#endif

#endif
