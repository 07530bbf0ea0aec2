//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/source_loader.hpp
// Purpose: Load the text a command-line tool segments, from a file or a stream.
// Key invariants: A successful load holds the complete input, byte for byte.
// Ownership/Lifetime: The caller owns the returned buffer.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>

namespace grapheme::tools
{

/// @brief Largest input the tools accept.
inline constexpr std::uint64_t kMaxInputSize = 256ULL * 1024 * 1024;

/// @brief Read the whole of @p path into memory.
///
/// @param path Filesystem path to the input file.
/// @return File contents on success; otherwise a diagnostic naming the file and
///         describing the I/O failure or size limit.
support::Expected<std::string> loadTextFile(const std::string &path);

/// @brief Read @p in to end of stream.
///
/// @param in Stream to drain, typically std::cin.
/// @param name Label used in diagnostics, e.g. "<stdin>".
/// @return Stream contents, or a diagnostic when reading fails or the input
///         exceeds kMaxInputSize.
support::Expected<std::string> loadTextStream(std::istream &in, const std::string &name);

} // namespace grapheme::tools
