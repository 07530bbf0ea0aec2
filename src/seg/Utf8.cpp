//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/seg/Utf8.cpp
// Purpose: Provide out-of-line helpers for the seg::Utf8Cursor utility.
// Key invariants: Forward and backward decoding agree on code point boundaries
//                 for well-formed input.
// Ownership/Lifetime: Operates on caller-owned string_view buffers.
// Links: include/grapheme/seg/Utf8.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements strict UTF-8 decoding in both directions.
/// @details Overlong forms, surrogates and values above U+10FFFF are rejected
///          the same way as truncated sequences: the lead byte decodes to
///          U+FFFD and the cursor moves by one byte.

#include "grapheme/seg/Utf8.hpp"

#include <cstdint>

namespace grapheme::seg
{

namespace
{
[[nodiscard]] bool isContinuation(unsigned char byte) noexcept
{
    return (byte & 0xC0) == 0x80;
}

constexpr DecodedCodePoint kInvalid{kReplacementChar, 1};
} // namespace

DecodedCodePoint decodeAt(std::string_view text, std::size_t offset) noexcept
{
    const auto lead = static_cast<unsigned char>(text[offset]);
    if (lead < 0x80)
        return {lead, 1};

    std::size_t length = 0;
    char32_t value = 0;
    // Bounds on the second byte encode the overlong/surrogate/range rules.
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF)
    {
        length = 2;
        value = lead & 0x1F;
    }
    else if (lead >= 0xE0 && lead <= 0xEF)
    {
        length = 3;
        value = lead & 0x0F;
        if (lead == 0xE0)
            lo = 0xA0;
        else if (lead == 0xED)
            hi = 0x9F;
    }
    else if (lead >= 0xF0 && lead <= 0xF4)
    {
        length = 4;
        value = lead & 0x07;
        if (lead == 0xF0)
            lo = 0x90;
        else if (lead == 0xF4)
            hi = 0x8F;
    }
    else
    {
        return kInvalid;
    }

    if (text.size() - offset < length)
        return kInvalid;

    const auto second = static_cast<unsigned char>(text[offset + 1]);
    if (second < lo || second > hi)
        return kInvalid;
    value = (value << 6) | (second & 0x3F);

    for (std::size_t i = 2; i < length; ++i)
    {
        const auto byte = static_cast<unsigned char>(text[offset + i]);
        if (!isContinuation(byte))
            return kInvalid;
        value = (value << 6) | (byte & 0x3F);
    }
    return {value, length};
}

DecodedCodePoint decodeBefore(std::string_view text, std::size_t end) noexcept
{
    std::size_t start = end - 1;
    while (start > 0 && end - start < 4 && isContinuation(static_cast<unsigned char>(text[start])))
        --start;

    const DecodedCodePoint decoded = decodeAt(text, start);
    if (start + decoded.length == end)
        return decoded;
    // The final byte does not complete a valid sequence; forward decoding
    // consumes it on its own as well.
    return kInvalid;
}

Utf8Cursor::Utf8Cursor(std::string_view text, std::size_t offset) noexcept
    : text_(text), index_(offset > text.size() ? text.size() : offset)
{
}

DecodedCodePoint Utf8Cursor::advance() noexcept
{
    if (atEnd())
        return {};
    const DecodedCodePoint decoded = decodeAt(text_, index_);
    index_ += decoded.length;
    return decoded;
}

DecodedCodePoint Utf8Cursor::retreat() noexcept
{
    if (atStart())
        return {};
    const DecodedCodePoint decoded = decodeBefore(text_, index_);
    index_ -= decoded.length;
    return decoded;
}

} // namespace grapheme::seg
