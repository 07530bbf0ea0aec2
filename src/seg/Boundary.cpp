//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/seg/Boundary.cpp
// Purpose: Implement the UAX #29 extended grapheme cluster boundary rules.
// Key invariants: localBoundary() never answers NeedsContext for a pair that
//                 the context-free rules can settle; isBoundary() always
//                 settles.
// Ownership/Lifetime: Stateless; scans borrow the caller's text.
// Links: include/grapheme/seg/Boundary.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Boundary decision logic shared by every iterator.
/// @details Rule numbers in the comments refer to the UAX #29 grapheme cluster
///          boundary rules.  GB1/GB2 (boundaries at both ends of the text) are
///          implicit in how the scans start and stop.

#include "grapheme/seg/Boundary.hpp"

#include "grapheme/seg/Utf8.hpp"
#include "grapheme/ucd/Lookup.hpp"

namespace grapheme::seg
{

using P = PropertyClass;

Context Context::step(PropertyClass p) const noexcept
{
    // GB9c: Consonant [Extend Linker]* Linker [Extend Linker]* x Consonant
    if (p == P::IndicConsonant)
        return indic(false);
    if (kind_ == Kind::Indic)
    {
        if (p == P::IndicLinker)
            return indic(true);
        if (ucd::isIncbExtend(p))
            return *this;
    }

    // GB11: ExtPict Extend* ZWJ x ExtPict
    if (p == P::ExtendedPictographic)
        return emoji(false);
    if (kind_ == Kind::Emoji && !flag_)
    {
        if (ucd::isGcbExtend(p))
            return emoji(false);
        if (p == P::ZWJ)
            return emoji(true);
    }

    // GB12/GB13: pair regional indicators from the left.
    if (p == P::RegionalIndicator)
        return kind_ == Kind::RegionalIndicatorOpen ? start() : regionalIndicatorOpen();

    return start();
}

BoundaryQuery localBoundary(PropertyClass prev, PropertyClass next) noexcept
{
    if (prev == P::Default && next == P::Default)
        return BoundaryQuery::Boundary;

    // GB3
    if (prev == P::CarriageReturn && next == P::LineFeed)
        return BoundaryQuery::NoBoundary;
    // GB4, GB5
    if (ucd::isControl(prev) || ucd::isControl(next))
        return BoundaryQuery::Boundary;

    // GB6, GB7, GB8
    if (ucd::isHangul(prev) && ucd::isHangul(next))
    {
        const bool merge = (prev == P::HangulL && next != P::HangulT) ||
                           ((prev == P::HangulLV || prev == P::HangulV) &&
                            (next == P::HangulV || next == P::HangulT)) ||
                           ((prev == P::HangulLVT || prev == P::HangulT) && next == P::HangulT);
        return merge ? BoundaryQuery::NoBoundary : BoundaryQuery::Boundary;
    }

    // GB9
    if (ucd::isGcbExtend(next) || next == P::ZWJ)
        return BoundaryQuery::NoBoundary;
    // GB9a, GB9b
    if (next == P::SpacingMark || prev == P::Prepend)
        return BoundaryQuery::NoBoundary;

    // GB9c
    if ((ucd::isIncbExtend(prev) || prev == P::IndicLinker) && next == P::IndicConsonant)
        return BoundaryQuery::NeedsContext;
    // GB11
    if (prev == P::ZWJ && next == P::ExtendedPictographic)
        return BoundaryQuery::NeedsContext;
    // GB12, GB13
    if (prev == P::RegionalIndicator && next == P::RegionalIndicator)
        return BoundaryQuery::NeedsContext;

    // GB999
    return BoundaryQuery::Boundary;
}

bool isBoundary(Context context, PropertyClass prev, PropertyClass next) noexcept
{
    switch (localBoundary(prev, next))
    {
        case BoundaryQuery::Boundary:
            return true;
        case BoundaryQuery::NoBoundary:
            return false;
        case BoundaryQuery::NeedsContext:
            break;
    }

    const bool merge =
        (context == Context::indic(true) && next == P::IndicConsonant) ||
        (context == Context::emoji(true) && next == P::ExtendedPictographic) ||
        (context == Context::regionalIndicatorOpen() && next == P::RegionalIndicator);
    return !merge;
}

std::size_t firstBoundary(std::string_view text)
{
    Utf8Cursor cursor(text);
    if (cursor.atEnd())
        return 0;

    PropertyClass prev = ucd::classify(cursor.advance().value);
    Context context = Context::start().step(prev);
    while (!cursor.atEnd())
    {
        const std::size_t at = cursor.offset();
        const PropertyClass next = ucd::classify(cursor.advance().value);
        if (isBoundary(context, prev, next))
            return at;
        context = context.step(next);
        prev = next;
    }
    return text.size();
}

LocalBoundaryScan lastLocalBoundary(std::string_view text)
{
    LocalBoundaryScan scan;
    Utf8Cursor cursor(text, text.size());
    if (cursor.atStart())
        return scan;

    PropertyClass next = ucd::classify(cursor.retreat().value);
    while (!cursor.atStart())
    {
        // The pair (prev, next) straddles this offset.
        const std::size_t between = cursor.offset();
        const PropertyClass prev = ucd::classify(cursor.retreat().value);
        switch (localBoundary(prev, next))
        {
            case BoundaryQuery::Boundary:
                scan.offset = between;
                return scan;
            case BoundaryQuery::NeedsContext:
                scan.mayHaveSkipped = true;
                break;
            case BoundaryQuery::NoBoundary:
                break;
        }
        next = prev;
    }
    return scan;
}

} // namespace grapheme::seg
