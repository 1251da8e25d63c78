// Copyright 2024 The powser developers
//
// This file is part of the powser library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

// Minimal main file to reduce catch compile times:
// https://github.com/catchorg/Catch2/blob/v2.x/docs/slow-compiles.md

#define CATCH_CONFIG_MAIN

#include <catch2/catch.hpp>
