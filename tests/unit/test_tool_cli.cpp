//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_tool_cli.cpp
// Purpose: Cover grapheme-dump option parsing, output formats and the input
//          loader.
// Key invariants: Unknown options are usage errors; output is deterministic.
// Ownership/Lifetime: Output is captured in test-owned string streams.
// Links: src/tools/grapheme-dump/cli.hpp, src/tools/common/source_loader.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "SegTestUtil.hpp"
#include "tools/common/source_loader.hpp"
#include "tools/grapheme-dump/cli.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

using namespace grapheme::tools;
using grapheme::test::encode;

namespace
{
/// @brief Owns argv storage for parseDumpArgs().
class Args
{
  public:
    Args(std::initializer_list<const char *> values) : storage_(values.begin(), values.end())
    {
        for (std::string &s : storage_)
            pointers_.push_back(s.data());
    }

    ArgvView view()
    {
        return ArgvView{static_cast<int>(pointers_.size()), pointers_.data()};
    }

  private:
    std::vector<std::string> storage_;
    std::vector<char *> pointers_;
};

struct DumpOutput
{
    int exitCode;
    std::string out;
    std::string err;
};

DumpOutput dump(const DumpOptions &opts, std::string_view text)
{
    std::ostringstream out;
    std::ostringstream err;
    const int rc = runDump(opts, text, out, err);
    return DumpOutput{rc, out.str(), err.str()};
}
} // namespace

TEST(ToolCliParse, Defaults)
{
    Args args{};
    auto parsed = parseDumpArgs(args.view());
    ASSERT_TRUE(parsed);
    const DumpOptions &opts = parsed.value();
    EXPECT_EQ(opts.output, DumpOptions::Output::Clusters);
    EXPECT_FALSE(opts.reverse);
    EXPECT_FALSE(opts.stats);
    EXPECT_FALSE(opts.help);
    EXPECT_FALSE(opts.trace.enabled());
    EXPECT_TRUE(opts.input.empty());
}

TEST(ToolCliParse, AllFlags)
{
    Args args{"--reverse", "--offsets", "--stats", "--trace", "input.txt"};
    auto parsed = parseDumpArgs(args.view());
    ASSERT_TRUE(parsed);
    const DumpOptions &opts = parsed.value();
    EXPECT_EQ(opts.output, DumpOptions::Output::Offsets);
    EXPECT_TRUE(opts.reverse);
    EXPECT_TRUE(opts.stats);
    EXPECT_TRUE(opts.trace.enabled());
    EXPECT_EQ(opts.input, "input.txt");
}

TEST(ToolCliParse, HelpAndStdinDash)
{
    Args args{"-h", "-"};
    auto parsed = parseDumpArgs(args.view());
    ASSERT_TRUE(parsed);
    EXPECT_TRUE(parsed.value().help);
    EXPECT_EQ(parsed.value().input, "-");
}

TEST(ToolCliParse, RejectsUnknownOption)
{
    Args args{"--bogus"};
    auto parsed = parseDumpArgs(args.view());
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().message, "unknown option '--bogus'");
}

TEST(ToolCliParse, RejectsSecondInput)
{
    Args args{"a.txt", "b.txt"};
    auto parsed = parseDumpArgs(args.view());
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().message, "unexpected argument 'b.txt'");
}

TEST(ToolCliDump, ClustersForward)
{
    const DumpOutput result = dump(DumpOptions{}, encode({U'a', 0x0308, U'b'}));
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.out, "- U+0061 U+0308\n- U+0062\n");
    EXPECT_TRUE(result.err.empty());
}

TEST(ToolCliDump, OffsetsBothWays)
{
    DumpOptions opts;
    opts.output = DumpOptions::Output::Offsets;
    EXPECT_EQ(dump(opts, "a\r\nb").out, "1\n3\n4\n");
    opts.reverse = true;
    EXPECT_EQ(dump(opts, "a\r\nb").out, "3\n1\n0\n");
}

TEST(ToolCliDump, ClassesAnnotateCodePoints)
{
    DumpOptions opts;
    opts.output = DumpOptions::Output::Classes;
    EXPECT_EQ(dump(opts, encode({0x1F1E6, 0x1F1E8, U'\r', U'\n'})).out,
              "- U+1F1E6/RI U+1F1E8/RI\n- U+000D/CR U+000A/LF\n");
}

TEST(ToolCliDump, ReverseStatsAndTrace)
{
    DumpOptions opts;
    opts.reverse = true;
    opts.stats = true;
    opts.trace.mode = grapheme::support::TraceConfig::Boundaries;
    const DumpOutput result = dump(opts, encode({0x1F1E6, 0x1F1E8, 0x1F1E9}));
    EXPECT_EQ(result.out, "- U+1F1E9\n- U+1F1E6 U+1F1E8\n");
    EXPECT_EQ(result.err,
              "trace: rescan 0..12\n"
              "trace: bwd 8\n"
              "trace: bwd 0\n"
              "clusters: 2\n"
              "rescans: 1\n");
}

TEST(ToolCliUsage, MentionsEveryOption)
{
    std::ostringstream os;
    printUsage(os);
    const std::string text = os.str();
    for (const char *option : {"--reverse", "--offsets", "--classes", "--stats", "--trace", "--help"})
        EXPECT_NE(text.find(option), std::string::npos) << option;
}

TEST(ToolSourceLoader, ReadsFileAndReportsMissing)
{
    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / "grapheme_cli_loader_test.txt";
    {
        std::ofstream file(path, std::ios::binary);
        file << "x\r\ny";
    }
    auto loaded = loadTextFile(path.string());
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.value(), "x\r\ny");
    std::filesystem::remove(path);

    auto missing = loadTextFile(path.string());
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().path, path.string());
    EXPECT_EQ(missing.error().message, "unable to open file");
}

TEST(ToolSourceLoader, ReadsStream)
{
    std::istringstream in("hello");
    auto loaded = loadTextStream(in, "<stdin>");
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.value(), "hello");

    std::istringstream empty("");
    auto none = loadTextStream(empty, "<stdin>");
    ASSERT_TRUE(none);
    EXPECT_TRUE(none.value().empty());
}
