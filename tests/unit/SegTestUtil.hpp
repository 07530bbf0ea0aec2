//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/SegTestUtil.hpp
// Purpose: Helpers shared by the segmentation unit tests: UTF-8 encoding of
//          code point lists and draining of pull-style iterators.
// Key invariants: encode() only accepts Unicode scalar values.
// Ownership/Lifetime: All helpers return owning containers.
// Links: include/grapheme/Grapheme.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace grapheme::test
{

/// @brief Encode a list of scalar values as UTF-8.
inline std::string encode(std::initializer_list<char32_t> codePoints)
{
    std::string out;
    for (char32_t cp : codePoints)
    {
        if (cp < 0x80)
        {
            out.push_back(static_cast<char>(cp));
        }
        else if (cp < 0x800)
        {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else if (cp < 0x10000)
        {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else
        {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

/// @brief Repeat @p unit @p times.
inline std::string repeat(std::string_view unit, std::size_t times)
{
    std::string out;
    out.reserve(unit.size() * times);
    for (std::size_t i = 0; i < times; ++i)
        out.append(unit);
    return out;
}

/// @brief Pull every value out of @p source via next().
template <class Source> auto drain(Source &source)
{
    std::vector<typename decltype(source.next())::value_type> out;
    while (auto value = source.next())
        out.push_back(*value);
    return out;
}

/// @brief Same as drain() but consumes a temporary.
template <class Source> auto drain(Source &&source)
{
    Source local = std::move(source);
    return drain(local);
}

} // namespace grapheme::test
