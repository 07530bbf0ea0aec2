//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/grapheme/ucd/Lookup.hpp
// Purpose: Declare the code point classifier and its backing range table.
// Key invariants: The table is sorted by start, disjoint, and never changes
//                 once built.
// Ownership/Lifetime: The table is a process-wide singleton built on first use.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "grapheme/ucd/Property.hpp"

#include <cstdint>
#include <span>

namespace grapheme::ucd
{

/// @brief A run of code points sharing one property class.
struct CharRange
{
    char32_t start;      ///< First code point of the run.
    std::uint16_t count; ///< Number of code points in the run; never zero.
    PropertyClass kind;  ///< Class shared by every code point in the run.

    /// @brief One past the last code point in the run.
    [[nodiscard]] constexpr char32_t end() const noexcept
    {
        return start + count;
    }
};

/// @brief Version of the Unicode Character Database behind the table.
struct UnicodeVersion
{
    std::uint8_t major;
    std::uint8_t minor;
    std::uint8_t patch;
};

/// @brief Classify @p cp for grapheme segmentation.
/// @details Checks the printable ASCII and CJK fast paths, then computes
///          precomposed Hangul syllables arithmetically, then binary searches
///          the range table.  Code points not covered (including values above
///          U+10FFFF) classify as PropertyClass::Default.
[[nodiscard]] PropertyClass classify(char32_t cp);

/// @brief Read-only view of the sorted range table, building it if needed.
[[nodiscard]] std::span<const CharRange> ranges();

/// @brief Unicode version of the character database the table was built from.
[[nodiscard]] UnicodeVersion unicodeVersion() noexcept;

} // namespace grapheme::ucd
