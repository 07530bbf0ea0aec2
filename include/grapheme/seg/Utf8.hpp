//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/grapheme/seg/Utf8.hpp
// Purpose: Declare a bidirectional code point cursor over UTF-8 text.
// Key invariants: Operates on a string_view without allocating or owning
//                 storage; offsets always sit on code point boundaries of
//                 well-formed input.
// Ownership/Lifetime: Views textual buffers owned by the caller.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief UTF-8 decoding primitives shared by the boundary scans.
/// @details Input is expected to be well-formed UTF-8.  Ill-formed bytes never
///          cause out-of-bounds reads: each one decodes to U+FFFD with length 1.

#pragma once

#include <cstddef>
#include <string_view>

namespace grapheme::seg
{

/// @brief Replacement character produced for ill-formed bytes.
inline constexpr char32_t kReplacementChar = 0xFFFD;

/// @brief One decoded code point and the number of bytes it occupies.
struct DecodedCodePoint
{
    char32_t value = 0;     ///< Scalar value (U+FFFD for ill-formed bytes).
    std::size_t length = 0; ///< Encoded length in bytes, 1-4.
};

/// @brief Decode the code point starting at @p offset.
/// @pre offset < text.size()
[[nodiscard]] DecodedCodePoint decodeAt(std::string_view text, std::size_t offset) noexcept;

/// @brief Decode the code point that ends immediately before @p end.
/// @pre 0 < end <= text.size()
[[nodiscard]] DecodedCodePoint decodeBefore(std::string_view text, std::size_t end) noexcept;

/// @brief Lightweight bidirectional cursor stepping over code points.
class Utf8Cursor
{
  public:
    /// @brief Construct a cursor over @p text positioned at @p offset.
    explicit Utf8Cursor(std::string_view text, std::size_t offset = 0) noexcept;

    /// @brief Return the backing view observed by the cursor.
    [[nodiscard]] std::string_view view() const noexcept
    {
        return text_;
    }

    /// @brief Retrieve the current byte offset.
    [[nodiscard]] std::size_t offset() const noexcept
    {
        return index_;
    }

    /// @brief Query whether the cursor has reached the end of the buffer.
    [[nodiscard]] bool atEnd() const noexcept
    {
        return index_ >= text_.size();
    }

    /// @brief Query whether the cursor sits at the start of the buffer.
    [[nodiscard]] bool atStart() const noexcept
    {
        return index_ == 0;
    }

    /// @brief Consume the code point after the cursor.
    /// @return The decoded code point; length 0 when already at the end.
    DecodedCodePoint advance() noexcept;

    /// @brief Consume the code point before the cursor, moving backward.
    /// @return The decoded code point; length 0 when already at the start.
    DecodedCodePoint retreat() noexcept;

  private:
    std::string_view text_;
    std::size_t index_ = 0;
};

} // namespace grapheme::seg
