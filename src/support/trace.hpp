//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/trace.hpp
// Purpose: Declare tracing configuration and sink for boundary emission.
// Key invariants: Trace output is deterministic and line-oriented.
// Ownership/Lifetime: Sink borrows its output stream; the caller keeps it alive.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <iosfwd>

namespace grapheme::support
{

/// @brief Configuration for boundary tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,        ///< Tracing disabled
        Boundaries, ///< Trace every emitted boundary
    } mode{Off};

    /// @brief Check whether tracing is enabled.
    /// @return True if mode is not Off.
    bool enabled() const;
};

/// @brief Direction tag recorded alongside each traced boundary.
enum class TraceDirection
{
    Forward,
    Backward,
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    /// @brief Create sink writing to @p os with configuration @p cfg.
    TraceSink(std::ostream &os, TraceConfig cfg = {});

    /// @brief Record that a boundary at @p offset was emitted in direction @p dir.
    void onBoundary(TraceDirection dir, std::size_t offset);

    /// @brief Record that a backward step needed a forward rescan from @p from.
    void onRescan(std::size_t from, std::size_t to);

  private:
    std::ostream &os_;
    TraceConfig cfg_; ///< Active configuration
};

} // namespace grapheme::support
