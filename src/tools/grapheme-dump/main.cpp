//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the CLI entry point that splits a UTF-8 file into extended
// grapheme clusters and prints them one per line for inspection and golden
// tests.
//
//===----------------------------------------------------------------------===//

#include "tools/common/source_loader.hpp"
#include "tools/grapheme-dump/cli.hpp"

#include <iostream>

using namespace grapheme;

/// @brief Tool entry point.
///
/// Parses the options, loads the named file (or standard input) and hands the
/// text to runDump(). Usage errors print the diagnostic followed by the usage
/// text.
///
/// @return 0 on success, 1 when the input cannot be read, 2 on a usage error.
int main(int argc, char **argv)
{
    const tools::ArgvView args = tools::ArgvView{argc, argv}.drop_front();
    support::Expected<tools::DumpOptions> parsed = tools::parseDumpArgs(args);
    if (!parsed)
    {
        support::printDiag(parsed.error(), std::cerr);
        tools::printUsage(std::cerr);
        return 2;
    }

    const tools::DumpOptions &opts = parsed.value();
    if (opts.help)
    {
        tools::printUsage(std::cout);
        return 0;
    }

    support::Expected<std::string> text =
        (opts.input.empty() || opts.input == "-") ? tools::loadTextStream(std::cin, "<stdin>")
                                                   : tools::loadTextFile(opts.input);
    if (!text)
    {
        support::printDiag(text.error(), std::cerr);
        return 1;
    }
    return tools::runDump(opts, text.value(), std::cout, std::cerr);
}
