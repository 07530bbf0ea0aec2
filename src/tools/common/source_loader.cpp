//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/source_loader.cpp
// Purpose: Standardise how command-line tools load their input text.
// Key invariants: The loaded buffer contains the complete input.
// Ownership/Lifetime: The returned buffer is owned by the caller.
// Links: src/tools/common/source_loader.hpp
//
//===----------------------------------------------------------------------===//

#include "tools/common/source_loader.hpp"

#include <fstream>
#include <istream>
#include <new>
#include <sstream>

namespace grapheme::tools
{

namespace
{
std::string tooLargeMessage()
{
    return "input too large (limit: 256 MB)";
}
} // namespace

support::Expected<std::string> loadTextFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return support::makeError(path, "unable to open file");
    }

    // Check the size up front to avoid OOM on huge files.
    in.seekg(0, std::ios::end);
    const auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    if (fileSize < 0 || static_cast<std::uint64_t>(fileSize) > kMaxInputSize)
    {
        return support::makeError(path, tooLargeMessage());
    }
    return loadTextStream(in, path);
}

support::Expected<std::string> loadTextStream(std::istream &in, const std::string &name)
{
    std::string contents;
    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        contents = ss.str();
    }
    catch (const std::bad_alloc &)
    {
        return support::makeError(name, "out of memory reading input");
    }

    if (in.bad())
    {
        return support::makeError(name, "read failed");
    }
    if (contents.size() > kMaxInputSize)
    {
        return support::makeError(name, tooLargeMessage());
    }
    return contents;
}

} // namespace grapheme::tools
