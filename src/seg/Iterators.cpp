//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/seg/Iterators.cpp
// Purpose: Implement the forward/backward cluster iterators.
// Key invariants: Each deferred boundary is discovered by exactly one forward
//                 rescan and emitted exactly once.
// Ownership/Lifetime: Iterators borrow their text; the deferred stack is owned
//                     by the backward iterator instance.
// Links: include/grapheme/seg/Iterators.hpp
//
//===----------------------------------------------------------------------===//

#include "grapheme/seg/Iterators.hpp"

#include "grapheme/seg/Boundary.hpp"
#include "support/invariants.hpp"
#include "support/trace.hpp"

#include <utility>

namespace grapheme::seg
{

ForwardIndexIterator::ForwardIndexIterator(std::string_view text, std::size_t offset) noexcept
    : text_(text), offset_(offset > text.size() ? text.size() : offset)
{
}

std::optional<std::size_t> ForwardIndexIterator::next()
{
    if (offset_ == text_.size())
        return std::nullopt;
    offset_ += firstBoundary(text_.substr(offset_));
    if (trace_)
        trace_->onBoundary(support::TraceDirection::Forward, offset_);
    return offset_;
}

BackwardIndexIterator ForwardIndexIterator::reversed() const
{
    return BackwardIndexIterator(text_.substr(offset_));
}

BackwardIndexIterator::BackwardIndexIterator(std::string_view text) noexcept
    : text_(text), offset_(text.size())
{
}

BackwardIndexIterator::BackwardIndexIterator(std::string_view text, std::size_t offset) noexcept
    : text_(text), offset_(offset > text.size() ? text.size() : offset)
{
}

/// @brief Step to the start of the previous cluster.
///
/// @details Boundaries parked by an earlier rescan are served first.  Otherwise
///          the context-free backward scan proposes a candidate left edge.  If
///          that scan never crossed a pair needing context, the candidate is
///          exact.  If it did, the prefix [candidate, offset) is segmented
///          forward starting from the candidate (a boundary every rule agrees
///          on, so the scan may start there with a fresh context).  The rescan
///          ends exactly at the current offset; the start of its final cluster
///          is the answer and every earlier cluster start is deferred.
std::optional<std::size_t> BackwardIndexIterator::next()
{
    if (!deferred_.empty())
    {
        offset_ = deferred_.back();
        deferred_.pop_back();
        return emit();
    }
    if (offset_ == 0)
        return std::nullopt;

    const std::string_view prefix = text_.substr(0, offset_);
    const LocalBoundaryScan scan = lastLocalBoundary(prefix);
    if (!scan.mayHaveSkipped)
    {
        offset_ = scan.offset;
        return emit();
    }

    ++rescans_;
    if (trace_)
        trace_->onRescan(scan.offset, offset_);
    std::size_t clusterStart = scan.offset;
    ForwardIndexIterator forward(prefix, clusterStart);
    while (const std::optional<std::size_t> clusterEnd = forward.next())
    {
        if (*clusterEnd == offset_)
        {
            offset_ = clusterStart;
            return emit();
        }
        deferred_.push_back(clusterStart);
        clusterStart = *clusterEnd;
    }
    support::reportInvariantViolation("backward rescan did not end on the current offset");
}

std::size_t BackwardIndexIterator::emit()
{
    if (trace_)
        trace_->onBoundary(support::TraceDirection::Backward, offset_);
    return offset_;
}

ForwardSliceIterator::ForwardSliceIterator(std::string_view text) noexcept : indices_(text) {}

ForwardSliceIterator::ForwardSliceIterator(ForwardIndexIterator indices) noexcept
    : indices_(indices)
{
}

std::optional<std::string_view> ForwardSliceIterator::next()
{
    const std::size_t start = indices_.offset();
    const std::optional<std::size_t> end = indices_.next();
    if (!end)
        return std::nullopt;
    return indices_.text().substr(start, *end - start);
}

BackwardSliceIterator ForwardSliceIterator::reversed() const
{
    return BackwardSliceIterator(indices_.reversed());
}

BackwardSliceIterator::BackwardSliceIterator(std::string_view text) noexcept : indices_(text) {}

BackwardSliceIterator::BackwardSliceIterator(BackwardIndexIterator indices) noexcept
    : indices_(std::move(indices))
{
}

std::optional<std::string_view> BackwardSliceIterator::next()
{
    const std::size_t end = indices_.offset();
    const std::optional<std::size_t> start = indices_.next();
    if (!start)
        return std::nullopt;
    return indices_.text().substr(*start, end - *start);
}

} // namespace grapheme::seg
