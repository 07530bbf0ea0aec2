//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ucd/Lookup.cpp
// Purpose: Classify code points for grapheme segmentation.
// Key invariants: The range table is built once, validated, and never mutated.
// Ownership/Lifetime: The table lives in a function-local static for the rest
//                     of the process.
// Links: include/grapheme/ucd/Lookup.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Fast paths plus a binary search over the sorted range table.
/// @details Printable ASCII and the bulk of the CJK ideographs never reach the
///          table.  Precomposed Hangul syllables make up most of the non-default
///          code points but follow a fixed arithmetic pattern, so they are not
///          stored either.  Everything else costs O(log R) in the table size.

#include "grapheme/ucd/Lookup.hpp"

#include "support/invariants.hpp"
#include "ucd/TableBuilder.hpp"

#include <algorithm>
#include <vector>

namespace grapheme::ucd
{

namespace
{
/// @brief Table singleton; construction is thread-safe per the static-init rules.
const std::vector<CharRange> &table()
{
    static const std::vector<CharRange> instance = []
    {
        std::vector<CharRange> built = buildRangeTable();
        GRAPHEME_INVARIANT(isWellFormedTable(built),
                           "property range table must be sorted and disjoint");
        return built;
    }();
    return instance;
}
} // namespace

PropertyClass classify(char32_t cp)
{
    if ((cp >= 0x20 && cp < 0x7F) || (cp >= 0x3300 && cp < 0xA000))
        return PropertyClass::Default;

    if (cp >= kHangulSyllableFirst && cp <= kHangulSyllableLast)
    {
        return (cp - kHangulSyllableFirst) % kHangulTCount == 0 ? PropertyClass::HangulLV
                                                                : PropertyClass::HangulLVT;
    }

    const std::vector<CharRange> &ranges = table();
    // First range starting after cp; its predecessor is the only candidate.
    auto it = std::upper_bound(ranges.begin(),
                               ranges.end(),
                               cp,
                               [](char32_t value, const CharRange &range)
                               { return value < range.start; });
    if (it == ranges.begin())
        return PropertyClass::Default;
    --it;
    return cp < it->end() ? it->kind : PropertyClass::Default;
}

std::span<const CharRange> ranges()
{
    return table();
}

UnicodeVersion unicodeVersion() noexcept
{
    return databaseVersion();
}

} // namespace grapheme::ucd
