//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/invariants.hpp
//
// Purpose:
//   Centralizes how internal logic-invariant violations are reported. These
//   are programming errors in the rule tables or the boundary state machine,
//   never properties of valid input, so they terminate the process instead of
//   surfacing as recoverable errors.
//
// Invariants checked through this header:
//   - The Unicode property range table is sorted by start, non-overlapping,
//     and has no empty ranges.
//   - A backward forward-rescan always lands exactly on the offset it started
//     from (every text has an implicit boundary at its end).
//
//===----------------------------------------------------------------------===//

#pragma once

/// @brief Check an internal invariant in every build configuration.
/// @details Unlike assert() the check survives NDEBUG builds; failures are
///          routed through @ref grapheme::support::reportInvariantViolation.
#define GRAPHEME_INVARIANT(condition, message)                                                     \
    do                                                                                             \
    {                                                                                              \
        if (!(condition))                                                                          \
            ::grapheme::support::reportInvariantViolation(message);                                \
    } while (0)

namespace grapheme::support
{

/// @brief Report an internal invariant violation and terminate.
/// @details Writes "[FATAL] grapheme invariant violation: <message>" to stderr
///          and calls std::abort().
/// @param message Human-readable description of the violated invariant.
[[noreturn]] void reportInvariantViolation(const char *message);

} // namespace grapheme::support
