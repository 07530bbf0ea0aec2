//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ucd/TableBuilder.cpp
// Purpose: Derive the segmentation range table from ICU's copy of the Unicode
//          Character Database.
// Key invariants: Every stored run has a non-Default class and a count in
//                 [1, 0xFFFF]; runs are emitted in ascending code point order.
// Ownership/Lifetime: Stateless apart from ICU's own immutable data.
// Links: src/ucd/TableBuilder.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Builds the range table consulted by ucd::classify().
/// @details Grapheme_Cluster_Break and Extended_Pictographic come straight from
///          ICU.  Indic_Conjunct_Break is not exposed by the ICU release we
///          target, so it is derived the way UAX #44 defines it:
///          - Linker: Indic_Syllabic_Category=Virama in one of the six
///            conjunct-forming scripts;
///          - Consonant: Indic_Syllabic_Category=Consonant in those scripts;
///          - Extend: GCB=Extend with a non-zero canonical combining class
///            (linkers excluded), plus ZWJ.

#include "ucd/TableBuilder.hpp"

#include <unicode/uchar.h>
#include <unicode/uscript.h>
#include <unicode/uversion.h>

#include <algorithm>

namespace grapheme::ucd
{

namespace
{
constexpr std::uint32_t kMaxRunLength = 0xFFFF;

/// @brief Scripts whose viramas form conjuncts under rule GB9c.
[[nodiscard]] bool isConjunctScript(UChar32 c)
{
    switch (static_cast<UScriptCode>(u_getIntPropertyValue(c, UCHAR_SCRIPT)))
    {
        case USCRIPT_BENGALI:
        case USCRIPT_DEVANAGARI:
        case USCRIPT_GUJARATI:
        case USCRIPT_ORIYA:
        case USCRIPT_TELUGU:
        case USCRIPT_MALAYALAM:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] UIndicSyllabicCategory syllabicCategory(UChar32 c)
{
    return static_cast<UIndicSyllabicCategory>(
        u_getIntPropertyValue(c, UCHAR_INDIC_SYLLABIC_CATEGORY));
}

/// @brief Split GCB=Extend into the three InCB flavours.
[[nodiscard]] PropertyClass classifyExtend(UChar32 c)
{
    if (syllabicCategory(c) == U_INSC_VIRAMA && isConjunctScript(c))
        return PropertyClass::IndicLinker;
    if (u_getCombiningClass(c) != 0)
        return PropertyClass::IndicExtend;
    return PropertyClass::Extend;
}

[[nodiscard]] bool isPrecomposedHangul(char32_t cp)
{
    return cp >= kHangulSyllableFirst && cp <= kHangulSyllableLast;
}
} // namespace

PropertyClass classifyFromDatabase(char32_t cp)
{
    const auto c = static_cast<UChar32>(cp);
    switch (static_cast<UGraphemeClusterBreak>(u_getIntPropertyValue(c, UCHAR_GRAPHEME_CLUSTER_BREAK)))
    {
        case U_GCB_LF:
            return PropertyClass::LineFeed;
        case U_GCB_CR:
            return PropertyClass::CarriageReturn;
        case U_GCB_CONTROL:
            return PropertyClass::Control;
        case U_GCB_L:
            return PropertyClass::HangulL;
        case U_GCB_V:
            return PropertyClass::HangulV;
        case U_GCB_T:
            return PropertyClass::HangulT;
        case U_GCB_LV:
            return PropertyClass::HangulLV;
        case U_GCB_LVT:
            return PropertyClass::HangulLVT;
        case U_GCB_SPACING_MARK:
            return PropertyClass::SpacingMark;
        case U_GCB_PREPEND:
            return PropertyClass::Prepend;
        case U_GCB_REGIONAL_INDICATOR:
            return PropertyClass::RegionalIndicator;
        case U_GCB_ZWJ:
            return PropertyClass::ZWJ;
        case U_GCB_EXTEND:
            return classifyExtend(c);
        default:
            // Other, plus the deprecated emoji-modifier values.
            break;
    }

    if (u_hasBinaryProperty(c, UCHAR_EXTENDED_PICTOGRAPHIC))
        return PropertyClass::ExtendedPictographic;
    if (syllabicCategory(c) == U_INSC_CONSONANT && isConjunctScript(c))
        return PropertyClass::IndicConsonant;
    return PropertyClass::Default;
}

void appendRun(std::vector<CharRange> &table, char32_t first, char32_t last, PropertyClass kind)
{
    if (kind == PropertyClass::Default || last < first)
        return;
    char32_t start = first;
    while (start <= last)
    {
        const std::uint32_t remaining = static_cast<std::uint32_t>(last - start) + 1;
        const std::uint32_t count = std::min(remaining, kMaxRunLength);
        table.push_back(CharRange{start, static_cast<std::uint16_t>(count), kind});
        start += count;
    }
}

std::vector<CharRange> buildRangeTable()
{
    std::vector<CharRange> table;
    table.reserve(2048);

    auto classOf = [](char32_t cp)
    {
        // The precomposed syllables are computed arithmetically by classify().
        return isPrecomposedHangul(cp) ? PropertyClass::Default : classifyFromDatabase(cp);
    };

    char32_t runStart = 0;
    PropertyClass runKind = classOf(0);
    for (char32_t cp = 1; cp <= kMaxCodePoint; ++cp)
    {
        const PropertyClass kind = classOf(cp);
        if (kind == runKind)
            continue;
        appendRun(table, runStart, cp - 1, runKind);
        runStart = cp;
        runKind = kind;
    }
    appendRun(table, runStart, kMaxCodePoint, runKind);

    table.shrink_to_fit();
    return table;
}

bool isWellFormedTable(std::span<const CharRange> table) noexcept
{
    char32_t nextFree = 0;
    for (const CharRange &range : table)
    {
        if (range.count == 0 || range.start < nextFree)
            return false;
        if (range.end() - 1 > kMaxCodePoint)
            return false;
        nextFree = range.end();
    }
    return true;
}

UnicodeVersion databaseVersion() noexcept
{
    UVersionInfo info{};
    u_getUnicodeVersion(info);
    return UnicodeVersion{info[0], info[1], info[2]};
}

} // namespace grapheme::ucd
