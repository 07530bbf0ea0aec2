//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/grapheme/seg/Iterators.hpp
// Purpose: Declare lazy forward and backward iterators over extended grapheme
//          cluster boundaries and the substrings between them.
// Key invariants: Forward iteration yields cluster END offsets in strictly
//                 increasing order, ending at text.size(); backward iteration
//                 yields cluster START offsets in strictly decreasing order,
//                 ending at 0.  Both produce the same boundary set.
// Ownership/Lifetime: Iterators borrow the text; the caller keeps it alive for
//                     as long as any iterator or yielded slice is in use.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Forward/backward index iterators and their slice adapters.
/// @details Forward and backward are distinct types with different emission
///          semantics, not mechanical reverses of one another.  Each type
///          offers a pull-style next() returning std::nullopt at the end, plus
///          begin()/end() so it can drive a range-based for loop.  The range
///          interface consumes the iterator object it is called on.

#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>
#include <vector>

namespace grapheme::support
{
class TraceSink;
} // namespace grapheme::support

namespace grapheme::seg
{

namespace detail
{
/// @brief Input iterator pulling values from a source exposing next().
/// @tparam Source Type with `std::optional<Value> next()`.
template <class Source, class Value> class PullIterator
{
  public:
    using value_type = Value;
    using difference_type = std::ptrdiff_t;
    using iterator_category = std::input_iterator_tag;

    PullIterator() = default;

    explicit PullIterator(Source &source) : source_(&source), current_(source.next()) {}

    const value_type &operator*() const
    {
        return *current_;
    }

    PullIterator &operator++()
    {
        current_ = source_->next();
        return *this;
    }

    void operator++(int)
    {
        ++*this;
    }

    friend bool operator==(const PullIterator &it, std::default_sentinel_t) noexcept
    {
        return !it.current_.has_value();
    }

  private:
    Source *source_ = nullptr;
    std::optional<value_type> current_;
};
} // namespace detail

class BackwardIndexIterator;
class BackwardSliceIterator;

/// @brief Lazily yields the end offset of each cluster, front to back.
/// @details Copying the iterator yields an independent cursor, so a traversal
///          can be restarted from any point by keeping a copy.
class ForwardIndexIterator
{
  public:
    /// @brief Iterate @p text starting at byte @p offset (a cluster boundary).
    explicit ForwardIndexIterator(std::string_view text, std::size_t offset = 0) noexcept;

    /// @brief End offset of the next cluster, or nullopt once the text is consumed.
    std::optional<std::size_t> next();

    /// @brief Start of the unconsumed suffix.
    [[nodiscard]] std::size_t offset() const noexcept
    {
        return offset_;
    }

    [[nodiscard]] std::string_view text() const noexcept
    {
        return text_;
    }

    /// @brief Backward iterator over the unconsumed suffix.
    /// @details Offsets produced by the result are relative to that suffix.
    [[nodiscard]] BackwardIndexIterator reversed() const;

    /// @brief Report every emitted boundary to @p sink; nullptr detaches.
    void setTraceSink(support::TraceSink *sink) noexcept
    {
        trace_ = sink;
    }

    [[nodiscard]] detail::PullIterator<ForwardIndexIterator, std::size_t> begin()
    {
        return detail::PullIterator<ForwardIndexIterator, std::size_t>(*this);
    }

    [[nodiscard]] std::default_sentinel_t end() const noexcept
    {
        return {};
    }

  private:
    std::string_view text_;
    std::size_t offset_ = 0;
    support::TraceSink *trace_ = nullptr;
};

/// @brief Lazily yields the start offset of each cluster, back to front.
///
/// A context-free backward scan finds the nearest boundary that the pair rules
/// alone can confirm.  When that scan had to step over pairs needing context
/// (regional indicators, emoji ZWJ sequences, Indic conjuncts), the segment
/// between the confirmed boundary and the current offset is rescanned forward
/// once.  Every boundary the rescan discovers is parked on a deferred stack and
/// emitted by later calls without scanning again, so a full backward traversal
/// stays linear even over long runs of flags or joined emoji.
class BackwardIndexIterator
{
  public:
    /// @brief Iterate @p text backward from its end.
    explicit BackwardIndexIterator(std::string_view text) noexcept;

    /// @brief Iterate @p text backward from byte @p offset (a cluster boundary).
    BackwardIndexIterator(std::string_view text, std::size_t offset) noexcept;

    /// @brief Start offset of the previous cluster, or nullopt at the start of text.
    std::optional<std::size_t> next();

    /// @brief Right edge of the unconsumed prefix.
    [[nodiscard]] std::size_t offset() const noexcept
    {
        return offset_;
    }

    [[nodiscard]] std::string_view text() const noexcept
    {
        return text_;
    }

    /// @brief Number of forward rescans performed so far.
    [[nodiscard]] std::size_t rescanCount() const noexcept
    {
        return rescans_;
    }

    /// @brief Number of boundaries discovered but not yet emitted.
    [[nodiscard]] std::size_t pendingCount() const noexcept
    {
        return deferred_.size();
    }

    /// @brief Report emitted boundaries and forward rescans to @p sink.
    void setTraceSink(support::TraceSink *sink) noexcept
    {
        trace_ = sink;
    }

    [[nodiscard]] detail::PullIterator<BackwardIndexIterator, std::size_t> begin()
    {
        return detail::PullIterator<BackwardIndexIterator, std::size_t>(*this);
    }

    [[nodiscard]] std::default_sentinel_t end() const noexcept
    {
        return {};
    }

  private:
    std::size_t emit();

    std::string_view text_;
    std::size_t offset_ = 0;
    /// Boundaries below offset_, ascending from bottom to top.
    std::vector<std::size_t> deferred_;
    std::size_t rescans_ = 0;
    support::TraceSink *trace_ = nullptr;
};

/// @brief Yields each cluster as a substring, front to back.
class ForwardSliceIterator
{
  public:
    explicit ForwardSliceIterator(std::string_view text) noexcept;

    explicit ForwardSliceIterator(ForwardIndexIterator indices) noexcept;

    /// @brief Next cluster, or nullopt once the text is consumed.
    std::optional<std::string_view> next();

    /// @brief Backward slice iterator over the unconsumed suffix.
    [[nodiscard]] BackwardSliceIterator reversed() const;

    void setTraceSink(support::TraceSink *sink) noexcept
    {
        indices_.setTraceSink(sink);
    }

    [[nodiscard]] detail::PullIterator<ForwardSliceIterator, std::string_view> begin()
    {
        return detail::PullIterator<ForwardSliceIterator, std::string_view>(*this);
    }

    [[nodiscard]] std::default_sentinel_t end() const noexcept
    {
        return {};
    }

  private:
    ForwardIndexIterator indices_;
};

/// @brief Yields each cluster as a substring, back to front.
class BackwardSliceIterator
{
  public:
    explicit BackwardSliceIterator(std::string_view text) noexcept;

    explicit BackwardSliceIterator(BackwardIndexIterator indices) noexcept;

    /// @brief Previous cluster, or nullopt at the start of text.
    std::optional<std::string_view> next();

    /// @brief Number of forward rescans the underlying index iterator performed.
    [[nodiscard]] std::size_t rescanCount() const noexcept
    {
        return indices_.rescanCount();
    }

    void setTraceSink(support::TraceSink *sink) noexcept
    {
        indices_.setTraceSink(sink);
    }

    [[nodiscard]] detail::PullIterator<BackwardSliceIterator, std::string_view> begin()
    {
        return detail::PullIterator<BackwardSliceIterator, std::string_view>(*this);
    }

    [[nodiscard]] std::default_sentinel_t end() const noexcept
    {
        return {};
    }

  private:
    BackwardIndexIterator indices_;
};

} // namespace grapheme::seg
