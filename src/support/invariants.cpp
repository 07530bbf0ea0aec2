//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/invariants.cpp
// Purpose: Terminating reporter for internal logic-invariant violations.
// Key invariants: Never returns.
// Ownership/Lifetime: Stateless.
// Links: src/support/invariants.hpp
//
//===----------------------------------------------------------------------===//

#include "support/invariants.hpp"

#include <cstdio>
#include <cstdlib>

namespace grapheme::support
{

[[noreturn]] void reportInvariantViolation(const char *message)
{
    std::fprintf(stderr, "[FATAL] grapheme invariant violation: %s\n", message);
    std::fflush(stderr);
    std::abort();
}

} // namespace grapheme::support
