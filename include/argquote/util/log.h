// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <stdio.h>

namespace argquote {

// Log output goes to stderr, since stdout carries the
// command lines we produce

#ifndef NDEBUG
#define LOG(fmt, ...) fprintf(stderr, fmt "\n", ##__VA_ARGS__)
#else
#define LOG(fmt, ...) do {} while (0)
#endif

#define FORCE_LOG(fmt, ...) fprintf(stderr, fmt "\n", ##__VA_ARGS__)

} // namespace argquote
