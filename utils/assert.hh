/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <cstdio>
#include <cstdlib>

namespace utils {

[[noreturn]] inline void assert_failed(const char* expr, const char* file, int line, const char* func) noexcept {
    std::fprintf(stderr, "%s:%d: %s: Assertion `%s` failed.\n", file, line, func, expr);
    std::abort();
}

}

// Like assert(), but not compiled out in release builds.
#define BULKSTREAM_ASSERT(x) do { if (!(x)) [[unlikely]] { ::utils::assert_failed(#x, __FILE__, __LINE__, __PRETTY_FUNCTION__); } } while (0)
