//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/trace.cpp
// Purpose: Line-oriented trace output for boundary emission and rescans.
// Key invariants: One record per line, "trace: " prefix, decimal offsets.
// Ownership/Lifetime: Writes to a caller-owned stream.
// Links: src/support/trace.hpp
//
//===----------------------------------------------------------------------===//

#include "support/trace.hpp"

#include <locale>
#include <ostream>

namespace grapheme::support
{

/// @brief Determine whether tracing output should be emitted.
/// @return True when the trace mode is not TraceConfig::Off.
bool TraceConfig::enabled() const
{
    return mode != Off;
}

namespace
{
/// @brief Temporarily force the classic locale so offsets print without grouping.
class LocaleGuard
{
    std::ostream &os;
    std::locale oldLoc;

  public:
    explicit LocaleGuard(std::ostream &s) : os(s), oldLoc(s.getloc())
    {
        os.imbue(std::locale::classic());
    }

    ~LocaleGuard()
    {
        os.imbue(oldLoc);
    }
};

const char *directionName(TraceDirection dir)
{
    return dir == TraceDirection::Forward ? "fwd" : "bwd";
}
} // namespace

TraceSink::TraceSink(std::ostream &os, TraceConfig cfg) : os_(os), cfg_(cfg) {}

void TraceSink::onBoundary(TraceDirection dir, std::size_t offset)
{
    if (!cfg_.enabled())
        return;
    LocaleGuard lg(os_);
    os_ << std::dec << "trace: " << directionName(dir) << ' ' << offset << '\n';
}

void TraceSink::onRescan(std::size_t from, std::size_t to)
{
    if (!cfg_.enabled())
        return;
    LocaleGuard lg(os_);
    os_ << std::dec << "trace: rescan " << from << ".." << to << '\n';
}

} // namespace grapheme::support
