#pragma once

// Verbose diagnostics on stderr, enabled with -v.

#include <fmt/format.h>

#include <cstdio>

namespace nestdiff {

void
log_set_verbose(bool verbose);

bool
log_verbose();

}  // namespace nestdiff

#define NESTDIFF_DEBUG(...)                  \
    do {                                     \
        if (nestdiff::log_verbose()) {       \
            fmt::print(stderr, __VA_ARGS__); \
        }                                    \
    } while (0)
