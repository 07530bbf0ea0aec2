//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/grapheme-dump/cli.hpp
// Purpose: Option parsing and the dump driver for the grapheme-dump tool.
// Key invariants: runDump() writes records only to the streams it is given.
// Ownership/Lifetime: DumpOptions is a plain value; runDump() borrows the text.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/trace.hpp"
#include "tools/common/ArgvView.hpp"

#include <iosfwd>
#include <string>
#include <string_view>

namespace grapheme::tools
{

/// @brief Configuration of one grapheme-dump run.
struct DumpOptions
{
    /// @brief What each output line describes.
    enum class Output
    {
        Clusters, ///< `- U+XXXX ...` per cluster
        Offsets,  ///< One boundary offset per line
        Classes,  ///< Like Clusters, with each code point's property mnemonic
    };

    Output output = Output::Clusters;
    /// @brief Walk the text back to front.
    bool reverse = false;
    /// @brief Print the cluster count and rescan count to the error stream.
    bool stats = false;
    /// @brief Print usage and exit.
    bool help = false;
    /// @brief Boundary tracing requested via --trace.
    support::TraceConfig trace{};
    /// @brief Input path; empty or "-" reads standard input.
    std::string input{};
};

/// @brief Parse the arguments following the program name.
/// @return Parsed options, or a diagnostic for an unknown option or a second
///         input path.
support::Expected<DumpOptions> parseDumpArgs(ArgvView args);

/// @brief Write the synopsis and option list to @p os.
void printUsage(std::ostream &os);

/// @brief Segment @p text and print it as @p opts requests.
/// @param out Receives the dump records.
/// @param err Receives trace and statistics records.
/// @return Process exit code; always 0 since segmentation cannot fail.
int runDump(const DumpOptions &opts, std::string_view text, std::ostream &out, std::ostream &err);

} // namespace grapheme::tools
