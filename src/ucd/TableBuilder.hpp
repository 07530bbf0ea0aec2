//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ucd/TableBuilder.hpp
// Purpose: Derive the segmentation range table from the Unicode Character
//          Database shipped with ICU.
// Key invariants: Produced tables are sorted, disjoint, and omit Default runs
//                 and the precomposed Hangul block.
// Ownership/Lifetime: Returns tables by value; callers own them.
// Links: src/ucd/Lookup.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "grapheme/ucd/Lookup.hpp"

#include <span>
#include <vector>

namespace grapheme::ucd
{

/// @brief Highest valid Unicode scalar value.
inline constexpr char32_t kMaxCodePoint = 0x10FFFF;

/// @brief First precomposed Hangul syllable (GA).
inline constexpr char32_t kHangulSyllableFirst = 0xAC00;

/// @brief Last precomposed Hangul syllable (HIH).
inline constexpr char32_t kHangulSyllableLast = 0xD7A3;

/// @brief Number of trailing-consonant slots per LV syllable.
inline constexpr char32_t kHangulTCount = 28;

/// @brief Classify @p cp directly from the character database.
/// @details Slow path used only while building the table.  Deprecated GCB
///          values (E_Base, E_Modifier, Glue_After_Zwj, E_Base_GAZ) fold into
///          Default.  Indic_Conjunct_Break is derived from Indic_Syllabic_Category,
///          Script and Canonical_Combining_Class.
[[nodiscard]] PropertyClass classifyFromDatabase(char32_t cp);

/// @brief Build the full range table from the character database.
[[nodiscard]] std::vector<CharRange> buildRangeTable();

/// @brief Append the run [@p first, @p last] of class @p kind to @p table.
/// @details Default runs are dropped; long runs are split so each entry's
///          16-bit count stays in range.
void appendRun(std::vector<CharRange> &table, char32_t first, char32_t last, PropertyClass kind);

/// @brief Check that @p table is sorted by start, disjoint, and has no empty runs.
[[nodiscard]] bool isWellFormedTable(std::span<const CharRange> table) noexcept;

/// @brief Unicode version reported by the character database.
[[nodiscard]] UnicodeVersion databaseVersion() noexcept;

} // namespace grapheme::ucd
