// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <glog/logging.h>

//! Checks that are only evaluated in debug builds. In release builds the
//! condition is still type-checked but never executed.
#ifndef NDEBUG
#define DEBUG_CHECK(cond) CHECK(cond)
#define DEBUG_CHECK_LE(a, b) CHECK_LE(a, b)
#else
#define DEBUG_CHECK(cond) while (false) CHECK(cond)
#define DEBUG_CHECK_LE(a, b) while (false) CHECK_LE(a, b)
#endif
