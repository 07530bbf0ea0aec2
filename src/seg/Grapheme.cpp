//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/seg/Grapheme.cpp
// Purpose: Cursor-movement and counting helpers built on the cluster iterators.
// Key invariants: Results are always cluster boundaries within [0, text.size()].
// Ownership/Lifetime: Stateless; borrows the caller's text.
// Links: include/grapheme/Grapheme.hpp
//
//===----------------------------------------------------------------------===//

#include "grapheme/Grapheme.hpp"

#include "grapheme/seg/Boundary.hpp"

namespace grapheme
{

std::size_t countClusters(std::string_view text)
{
    std::size_t count = 0;
    ForwardIndexIterator ends(text);
    while (ends.next())
        ++count;
    return count;
}

std::size_t nextBoundary(std::string_view text, std::size_t offset)
{
    if (offset >= text.size())
        return text.size();
    return offset + seg::firstBoundary(text.substr(offset));
}

std::size_t previousBoundary(std::string_view text, std::size_t offset)
{
    BackwardIndexIterator starts(text, offset);
    return starts.next().value_or(0);
}

} // namespace grapheme
