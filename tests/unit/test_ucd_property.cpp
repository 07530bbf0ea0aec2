//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_ucd_property.cpp
// Purpose: Check the PropertyClass ordering, group predicates and mnemonics.
// Key invariants: Each predicate accepts exactly its contiguous group.
// Ownership/Lifetime: N/A.
// Links: include/grapheme/ucd/Property.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "grapheme/ucd/Property.hpp"

#include <set>
#include <string>

using namespace grapheme::ucd;

namespace
{
PropertyClass classAt(std::size_t ordinal)
{
    return static_cast<PropertyClass>(ordinal);
}
} // namespace

TEST(UcdProperty, ClassCount)
{
    EXPECT_EQ(kPropertyClassCount, 18u);
}

TEST(UcdProperty, ControlGroup)
{
    for (std::size_t i = 0; i < kPropertyClassCount; ++i)
    {
        const PropertyClass p = classAt(i);
        const bool expected = p == PropertyClass::LineFeed || p == PropertyClass::CarriageReturn ||
                              p == PropertyClass::Control;
        EXPECT_EQ(isControl(p), expected) << toString(p);
    }
}

TEST(UcdProperty, HangulGroup)
{
    EXPECT_TRUE(isHangul(PropertyClass::HangulL));
    EXPECT_TRUE(isHangul(PropertyClass::HangulV));
    EXPECT_TRUE(isHangul(PropertyClass::HangulT));
    EXPECT_TRUE(isHangul(PropertyClass::HangulLV));
    EXPECT_TRUE(isHangul(PropertyClass::HangulLVT));
    EXPECT_FALSE(isHangul(PropertyClass::Control));
    EXPECT_FALSE(isHangul(PropertyClass::SpacingMark));
}

TEST(UcdProperty, ExtendGroupsOverlapOnIndicExtend)
{
    EXPECT_TRUE(isIncbExtend(PropertyClass::ZWJ));
    EXPECT_TRUE(isIncbExtend(PropertyClass::IndicExtend));
    EXPECT_FALSE(isIncbExtend(PropertyClass::IndicLinker));
    EXPECT_FALSE(isIncbExtend(PropertyClass::Extend));
    EXPECT_FALSE(isIncbExtend(PropertyClass::IndicConsonant));

    EXPECT_FALSE(isGcbExtend(PropertyClass::ZWJ));
    EXPECT_TRUE(isGcbExtend(PropertyClass::IndicExtend));
    EXPECT_TRUE(isGcbExtend(PropertyClass::IndicLinker));
    EXPECT_TRUE(isGcbExtend(PropertyClass::Extend));
    EXPECT_FALSE(isGcbExtend(PropertyClass::ExtendedPictographic));
}

TEST(UcdProperty, PredicatesAreConstexpr)
{
    static_assert(isControl(PropertyClass::CarriageReturn));
    static_assert(!isHangul(PropertyClass::Default));
    static_assert(isIncbExtend(PropertyClass::IndicExtend) && isGcbExtend(PropertyClass::IndicExtend));
    SUCCEED();
}

TEST(UcdProperty, MnemonicsAreDistinct)
{
    std::set<std::string> seen;
    for (std::size_t i = 0; i < kPropertyClassCount; ++i)
        EXPECT_TRUE(seen.insert(std::string(toString(classAt(i)))).second) << i;

    EXPECT_EQ(toString(PropertyClass::Default), "XX");
    EXPECT_EQ(toString(PropertyClass::HangulLVT), "LVT");
    EXPECT_EQ(toString(PropertyClass::IndicLinker), "InLi");
    EXPECT_EQ(toString(PropertyClass::RegionalIndicator), "RI");
}
