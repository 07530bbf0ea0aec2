//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/grapheme-dump/cli.cpp
// Purpose: Implement grapheme-dump's option parser and output formatting.
// Key invariants: Output is deterministic and locale independent.
// Ownership/Lifetime: Borrows the input text for the duration of runDump().
// Links: src/tools/grapheme-dump/cli.hpp
//
//===----------------------------------------------------------------------===//

#include "tools/grapheme-dump/cli.hpp"

#include "grapheme/Grapheme.hpp"
#include "grapheme/seg/Utf8.hpp"
#include "grapheme/ucd/Property.hpp"

#include <cstdio>
#include <ostream>
#include <vector>

namespace grapheme::tools
{

namespace
{
/// @brief Format @p cp as `U+XXXX`, with at least four hex digits.
std::string formatCodePoint(char32_t cp)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(cp));
    return buf;
}

void printCluster(std::ostream &out, std::string_view cluster, bool withClasses)
{
    out << '-';
    seg::Utf8Cursor cursor(cluster);
    while (!cursor.atEnd())
    {
        const char32_t cp = cursor.advance().value;
        out << ' ' << formatCodePoint(cp);
        if (withClasses)
            out << '/' << ucd::toString(ucd::classify(cp));
    }
    out << '\n';
}

/// @brief Print one record for the cluster [start, end).
void printRecord(const DumpOptions &opts,
                 std::string_view text,
                 std::size_t start,
                 std::size_t end,
                 std::ostream &out)
{
    switch (opts.output)
    {
        case DumpOptions::Output::Offsets:
            out << (opts.reverse ? start : end) << '\n';
            break;
        case DumpOptions::Output::Clusters:
            printCluster(out, text.substr(start, end - start), false);
            break;
        case DumpOptions::Output::Classes:
            printCluster(out, text.substr(start, end - start), true);
            break;
    }
}
} // namespace

support::Expected<DumpOptions> parseDumpArgs(ArgvView args)
{
    DumpOptions opts;
    bool haveInput = false;
    for (int i = 0; i < args.size(); ++i)
    {
        const std::string_view arg = args.at(i);
        if (arg == "-h" || arg == "--help")
        {
            opts.help = true;
        }
        else if (arg == "--reverse")
        {
            opts.reverse = true;
        }
        else if (arg == "--offsets")
        {
            opts.output = DumpOptions::Output::Offsets;
        }
        else if (arg == "--classes")
        {
            opts.output = DumpOptions::Output::Classes;
        }
        else if (arg == "--stats")
        {
            opts.stats = true;
        }
        else if (arg == "--trace")
        {
            opts.trace.mode = support::TraceConfig::Boundaries;
        }
        else if (arg.size() > 1 && arg.front() == '-')
        {
            return support::makeError({}, "unknown option '" + std::string(arg) + "'");
        }
        else if (haveInput)
        {
            return support::makeError({}, "unexpected argument '" + std::string(arg) + "'");
        }
        else
        {
            opts.input = std::string(arg);
            haveInput = true;
        }
    }
    return opts;
}

void printUsage(std::ostream &os)
{
    os << "usage: grapheme-dump [options] [file]\n"
          "Split UTF-8 text into extended grapheme clusters.\n"
          "Reads standard input when no file or '-' is given.\n"
          "\n"
          "Options:\n"
          "  --reverse   Walk the text from the end\n"
          "  --offsets   Print boundary offsets instead of clusters\n"
          "  --classes   Annotate each code point with its property class\n"
          "  --stats     Print cluster and rescan counts to stderr\n"
          "  --trace     Log every boundary to stderr\n"
          "  -h, --help  Show this message\n";
}

int runDump(const DumpOptions &opts, std::string_view text, std::ostream &out, std::ostream &err)
{
    support::TraceSink sink(err, opts.trace);
    std::size_t count = 0;
    std::size_t rescans = 0;

    if (opts.reverse)
    {
        BackwardIndexIterator starts = clusterStarts(text);
        starts.setTraceSink(&sink);
        std::size_t end = text.size();
        for (std::size_t start : starts)
        {
            printRecord(opts, text, start, end, out);
            end = start;
            ++count;
        }
        rescans = starts.rescanCount();
    }
    else
    {
        ForwardIndexIterator ends = clusterEnds(text);
        ends.setTraceSink(&sink);
        std::size_t start = 0;
        for (std::size_t end : ends)
        {
            printRecord(opts, text, start, end, out);
            start = end;
            ++count;
        }
    }

    if (opts.stats)
    {
        err << "clusters: " << count << '\n';
        err << "rescans: " << rescans << '\n';
    }
    return 0;
}

} // namespace grapheme::tools
