//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/grapheme/Grapheme.hpp
// Purpose: Convenience entry points for extended grapheme cluster segmentation.
// Key invariants: All offsets are byte offsets into UTF-8 text.
// Ownership/Lifetime: Returned iterators borrow @p text; keep it alive.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Single include for library users.
/// @details Typical use:
/// @code
///   for (std::string_view cluster : grapheme::clusters(line))
///       render(cluster);
/// @endcode

#pragma once

#include "grapheme/seg/Iterators.hpp"
#include "grapheme/ucd/Lookup.hpp"

#include <cstddef>
#include <string_view>

namespace grapheme
{

using seg::BackwardIndexIterator;
using seg::BackwardSliceIterator;
using seg::ForwardIndexIterator;
using seg::ForwardSliceIterator;

/// @brief End offsets of every cluster, front to back.
[[nodiscard]] inline ForwardIndexIterator clusterEnds(std::string_view text) noexcept
{
    return ForwardIndexIterator(text);
}

/// @brief Start offsets of every cluster, back to front.
[[nodiscard]] inline BackwardIndexIterator clusterStarts(std::string_view text) noexcept
{
    return BackwardIndexIterator(text);
}

/// @brief Every cluster as a substring, front to back.
[[nodiscard]] inline ForwardSliceIterator clusters(std::string_view text) noexcept
{
    return ForwardSliceIterator(text);
}

/// @brief Every cluster as a substring, back to front.
[[nodiscard]] inline BackwardSliceIterator clustersReversed(std::string_view text) noexcept
{
    return BackwardSliceIterator(text);
}

/// @brief Number of extended grapheme clusters in @p text.
[[nodiscard]] std::size_t countClusters(std::string_view text);

/// @brief Boundary following the cluster boundary @p offset.
/// @details Returns text.size() when @p offset is at or past the end.
[[nodiscard]] std::size_t nextBoundary(std::string_view text, std::size_t offset);

/// @brief Boundary preceding the cluster boundary @p offset.
/// @details Returns 0 when @p offset is 0; offsets past the end are clamped.
[[nodiscard]] std::size_t previousBoundary(std::string_view text, std::size_t offset);

} // namespace grapheme
