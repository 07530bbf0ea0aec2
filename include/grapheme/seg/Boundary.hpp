//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/grapheme/seg/Boundary.hpp
// Purpose: Declare the extended grapheme cluster boundary rules.
// Key invariants: Context after processing code point i reflects exactly which
//                 multi-code-point rule (GB9c, GB11, GB12/13), if any, is still
//                 open at i.
// Ownership/Lifetime: Pure functions over caller-owned text.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Pairwise boundary test, context state machine and whole-string scans.
/// @details Most boundaries follow from the two adjacent code points alone
///          (a "local" boundary).  Three rule families need to look further
///          back: Indic conjuncts (GB9c), emoji ZWJ sequences (GB11) and
///          regional indicator pairs (GB12/GB13).  For those the pair test
///          answers NeedsContext and a small state machine carried through the
///          scan settles the question.

#pragma once

#include "grapheme/ucd/Property.hpp"

#include <cstddef>
#include <string_view>

namespace grapheme::seg
{

using ucd::PropertyClass;

/// @brief Outcome of a boundary test that only sees two code points.
enum class BoundaryQuery
{
    Boundary,     ///< A cluster boundary separates the pair.
    NoBoundary,   ///< The pair belongs to the same cluster.
    NeedsContext, ///< The pair alone cannot decide; consult the Context.
};

/// @brief Scan state tracking which multi-code-point rule is open.
class Context
{
  public:
    /// @brief Rule family the scan is currently inside.
    enum class Kind
    {
        Start,                 ///< At a confirmed boundary (or start of text).
        Indic,                 ///< Possible Indic conjunct (GB9c).
        Emoji,                 ///< Possible emoji ZWJ sequence (GB11).
        RegionalIndicatorOpen, ///< Odd number of regional indicators so far.
    };

    /// @brief Construct the Start state.
    constexpr Context() noexcept = default;

    [[nodiscard]] static constexpr Context start() noexcept
    {
        return Context{};
    }

    /// @param seenLinker True once a linker (virama) followed the consonant.
    [[nodiscard]] static constexpr Context indic(bool seenLinker) noexcept
    {
        return Context{Kind::Indic, seenLinker};
    }

    /// @param seenZwj True once a ZWJ followed the pictograph and its extenders.
    [[nodiscard]] static constexpr Context emoji(bool seenZwj) noexcept
    {
        return Context{Kind::Emoji, seenZwj};
    }

    [[nodiscard]] static constexpr Context regionalIndicatorOpen() noexcept
    {
        return Context{Kind::RegionalIndicatorOpen, false};
    }

    [[nodiscard]] constexpr Kind kind() const noexcept
    {
        return kind_;
    }

    /// @brief seenLinker for Indic, seenZwj for Emoji, false otherwise.
    [[nodiscard]] constexpr bool flag() const noexcept
    {
        return flag_;
    }

    friend constexpr bool operator==(const Context &, const Context &) noexcept = default;

    /// @brief Compute the state after a code point of class @p p.
    [[nodiscard]] Context step(PropertyClass p) const noexcept;

  private:
    constexpr Context(Kind kind, bool flag) noexcept : kind_(kind), flag_(flag) {}

    Kind kind_ = Kind::Start;
    bool flag_ = false;
};

/// @brief Free-function form of Context::step.
[[nodiscard]] inline Context step(Context context, PropertyClass p) noexcept
{
    return context.step(p);
}

/// @brief Decide the rules that only need the adjacent pair.
[[nodiscard]] BoundaryQuery localBoundary(PropertyClass prev, PropertyClass next) noexcept;

/// @brief Decide whether a boundary separates @p prev and @p next.
/// @param context State after processing @p prev.
[[nodiscard]] bool isBoundary(Context context, PropertyClass prev, PropertyClass next) noexcept;

/// @brief Offset of the first boundary in @p text, i.e. the length of its first cluster.
/// @return 0 for empty text; text.size() when the whole text is one cluster.
[[nodiscard]] std::size_t firstBoundary(std::string_view text);

/// @brief Result of a context-free backward scan.
struct LocalBoundaryScan
{
    std::size_t offset = 0;      ///< Offset just after the last local boundary, or 0.
    bool mayHaveSkipped = false; ///< A NeedsContext pair was crossed on the way.

    friend bool operator==(const LocalBoundaryScan &, const LocalBoundaryScan &) = default;
};

/// @brief Find the last boundary in @p text decidable without context.
/// @details Scans right to left using only localBoundary().  The flag is
///          conservative: it is raised whenever a NeedsContext pair was crossed,
///          even if that pair later turns out not to be a boundary.
[[nodiscard]] LocalBoundaryScan lastLocalBoundary(std::string_view text);

} // namespace grapheme::seg
