//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/grapheme/ucd/Property.hpp
// Purpose: Declare the combined per-code-point property class used by the
//          grapheme boundary rules.
// Key invariants: Enumerator order keeps the control, Hangul, InCB-extend and
//                 GCB-extend groups contiguous; the predicates below rely on it.
// Ownership/Lifetime: Header-only value helpers; no state.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Property classes combining Grapheme_Cluster_Break,
///        Indic_Conjunct_Break and Extended_Pictographic.
/// @details Only the combinations that occur in the Unicode Character Database
///          get an enumerator.  Group membership is tested by comparing
///          ordinals, so reordering the enumerators changes the meaning of the
///          predicates; the static_asserts at the bottom pin the layout.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace grapheme::ucd
{

/// @brief Segmentation-relevant class of a single code point.
enum class PropertyClass : std::uint8_t
{
    Default,              ///< GCB=Other, InCB=None, ExtPict=No
    LineFeed,             ///< GCB=LF
    CarriageReturn,       ///< GCB=CR
    Control,              ///< GCB=Control
    HangulL,              ///< GCB=L (leading consonant)
    HangulV,              ///< GCB=V (vowel)
    HangulT,              ///< GCB=T (trailing consonant)
    HangulLV,             ///< GCB=LV (precomposed L+V)
    HangulLVT,            ///< GCB=LVT (precomposed L+V+T)
    SpacingMark,          ///< GCB=SpacingMark
    Prepend,              ///< GCB=Prepend
    IndicConsonant,       ///< InCB=Consonant
    ZWJ,                  ///< GCB=ZWJ, InCB=Extend
    IndicExtend,          ///< GCB=Extend, InCB=Extend
    IndicLinker,          ///< GCB=Extend, InCB=Linker
    Extend,               ///< GCB=Extend, InCB=None
    ExtendedPictographic, ///< ExtPict=Yes
    RegionalIndicator,    ///< GCB=Regional_Indicator
};

/// @brief Number of enumerators in @ref PropertyClass.
inline constexpr std::size_t kPropertyClassCount =
    static_cast<std::size_t>(PropertyClass::RegionalIndicator) + 1;

/// @brief True for LF, CR and other control characters (GB4/GB5).
[[nodiscard]] constexpr bool isControl(PropertyClass p) noexcept
{
    return PropertyClass::LineFeed <= p && p <= PropertyClass::Control;
}

/// @brief True for the Hangul jamo and syllable classes (GB6-GB8).
[[nodiscard]] constexpr bool isHangul(PropertyClass p) noexcept
{
    return PropertyClass::HangulL <= p && p <= PropertyClass::HangulLVT;
}

/// @brief True when Indic_Conjunct_Break=Extend (ZWJ or IndicExtend).
[[nodiscard]] constexpr bool isIncbExtend(PropertyClass p) noexcept
{
    return PropertyClass::ZWJ <= p && p <= PropertyClass::IndicExtend;
}

/// @brief True when Grapheme_Cluster_Break=Extend (IndicExtend, IndicLinker, Extend).
[[nodiscard]] constexpr bool isGcbExtend(PropertyClass p) noexcept
{
    return PropertyClass::IndicExtend <= p && p <= PropertyClass::Extend;
}

/// @brief Short UCD-style mnemonic for @p p, e.g. "LVT" or "EP".
[[nodiscard]] std::string_view toString(PropertyClass p) noexcept;

static_assert(PropertyClass::Control == PropertyClass(3), "control group must start at LF");
static_assert(PropertyClass::HangulLVT == PropertyClass(8), "Hangul group must be contiguous");
static_assert(PropertyClass::IndicExtend == PropertyClass(13),
              "IndicExtend must sit between ZWJ and IndicLinker");
static_assert(PropertyClass::Extend == PropertyClass(15), "GCB-extend group must end at Extend");

} // namespace grapheme::ucd
