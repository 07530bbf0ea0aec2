//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_grapheme_facade.cpp
// Purpose: Verify the convenience functions in the top-level header.
// Key invariants: nextBoundary/previousBoundary step exactly one cluster.
// Ownership/Lifetime: N/A.
// Links: include/grapheme/Grapheme.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "SegTestUtil.hpp"
#include "grapheme/Grapheme.hpp"

#include <string>
#include <vector>

using grapheme::test::encode;
using grapheme::test::repeat;

namespace
{
const std::string kText = "e" + encode({0x0301}) + repeat(encode({0x1F1E6}), 3) + "\r\n";
} // namespace

TEST(GraphemeFacade, CountClusters)
{
    EXPECT_EQ(grapheme::countClusters(""), 0u);
    EXPECT_EQ(grapheme::countClusters("abc"), 3u);
    EXPECT_EQ(grapheme::countClusters(kText), 4u);
}

TEST(GraphemeFacade, IteratorFactories)
{
    std::vector<std::string_view> seen;
    for (std::string_view cluster : grapheme::clusters(kText))
        seen.push_back(cluster);
    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen.back(), "\r\n");

    std::vector<std::size_t> starts;
    for (std::size_t start : grapheme::clusterStarts(kText))
        starts.push_back(start);
    EXPECT_EQ(starts, (std::vector<std::size_t>{15, 11, 3, 0}));

    std::vector<std::size_t> ends;
    for (std::size_t end : grapheme::clusterEnds(kText))
        ends.push_back(end);
    EXPECT_EQ(ends, (std::vector<std::size_t>{3, 11, 15, 17}));

    auto reversed = grapheme::clustersReversed(kText);
    EXPECT_EQ(reversed.next(), std::optional<std::string_view>("\r\n"));
}

TEST(GraphemeFacade, NextBoundary)
{
    EXPECT_EQ(grapheme::nextBoundary(kText, 0), 3u);
    EXPECT_EQ(grapheme::nextBoundary(kText, 3), 11u);
    EXPECT_EQ(grapheme::nextBoundary(kText, 15), 17u);
    EXPECT_EQ(grapheme::nextBoundary(kText, 17), 17u);
    EXPECT_EQ(grapheme::nextBoundary(kText, 100), 17u);
}

TEST(GraphemeFacade, PreviousBoundary)
{
    EXPECT_EQ(grapheme::previousBoundary(kText, 17), 15u);
    EXPECT_EQ(grapheme::previousBoundary(kText, 15), 11u);
    EXPECT_EQ(grapheme::previousBoundary(kText, 11), 3u);
    EXPECT_EQ(grapheme::previousBoundary(kText, 3), 0u);
    EXPECT_EQ(grapheme::previousBoundary(kText, 0), 0u);
    EXPECT_EQ(grapheme::previousBoundary(kText, 100), 15u);
}
