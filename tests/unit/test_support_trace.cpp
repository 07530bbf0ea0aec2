//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_support_trace.cpp
// Purpose: Verify the boundary trace sink's record format and that iterators
//          report through an attached sink.
// Key invariants: A disabled sink writes nothing.
// Ownership/Lifetime: Sinks write into test-owned string streams.
// Links: src/support/trace.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "SegTestUtil.hpp"
#include "grapheme/Grapheme.hpp"
#include "support/trace.hpp"

#include <sstream>

using namespace grapheme;
using grapheme::support::TraceConfig;
using grapheme::support::TraceDirection;
using grapheme::support::TraceSink;

namespace
{
TraceConfig boundaries()
{
    TraceConfig cfg;
    cfg.mode = TraceConfig::Boundaries;
    return cfg;
}
} // namespace

TEST(SupportTrace, DisabledSinkIsSilent)
{
    std::ostringstream os;
    TraceSink sink(os);
    sink.onBoundary(TraceDirection::Forward, 3);
    sink.onRescan(0, 8);
    EXPECT_TRUE(os.str().empty());
}

TEST(SupportTrace, FormatsRecords)
{
    std::ostringstream os;
    TraceSink sink(os, boundaries());
    sink.onBoundary(TraceDirection::Forward, 3);
    sink.onBoundary(TraceDirection::Backward, 12345);
    sink.onRescan(0, 16);
    EXPECT_EQ(os.str(), "trace: fwd 3\ntrace: bwd 12345\ntrace: rescan 0..16\n");
}

TEST(SupportTrace, ForwardIteratorReportsEachEnd)
{
    std::ostringstream os;
    TraceSink sink(os, boundaries());
    ForwardIndexIterator ends(std::string_view("ab"));
    ends.setTraceSink(&sink);
    test::drain(ends);
    EXPECT_EQ(os.str(), "trace: fwd 1\ntrace: fwd 2\n");
}

TEST(SupportTrace, BackwardIteratorReportsRescan)
{
    const std::string flags = test::repeat(test::encode({0x1F1E6}), 4);
    std::ostringstream os;
    TraceSink sink(os, boundaries());
    BackwardIndexIterator starts(flags);
    starts.setTraceSink(&sink);
    test::drain(starts);
    EXPECT_EQ(os.str(), "trace: rescan 0..16\ntrace: bwd 8\ntrace: bwd 0\n");
}
