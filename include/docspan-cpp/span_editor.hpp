/// @file span_editor.hpp
/// @brief Split/merge/apply algorithms over Runs and Paragraphs.

#pragma once

#include <docspan-cpp/address_index.hpp>
#include <docspan-cpp/document.hpp>
#include <docspan-cpp/style.hpp>
#include <docspan-cpp/types.hpp>

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace docspan_cpp {

/// What an edit did, as far as callers building a response care.
struct EditOutcome {
    bool resolved{true};                ///< False if a referenced address had no run.
    bool structural{false};             ///< Paragraphs were created, merged or removed.
    std::optional<Selection> selection; ///< Caret or selection after the edit.
    std::vector<Address> touched;       ///< Addresses whose paragraphs changed.

    auto operator==(const EditOutcome&) const -> bool = default;
};

/// Performs partial-range text and style edits on a Document while keeping
/// every Run format-uniform and every untouched address stable.
///
/// All edits are built on split_at_offsets(): a run is cut into ordered
/// segments, the segment that carries the edit keeps the original address
/// (carry-over rule) and every other non-empty segment gets a fresh one.
/// Offsets are in code points and are clamped to the run's length.
///
/// An edit whose address does not resolve is a no-op reporting
/// `resolved == false`.
///
/// @code
/// auto editor = SpanEditor{doc, minter};
/// auto outcome = editor.insert_text(Caret{address, 0}, "Hi ", std::nullopt);
/// @endcode
class SpanEditor {
public:
    /// Bind an editor to a document and the session's address minter.
    SpanEditor(Document& doc, AddressMinter& minter)
        : doc_{doc}, minter_{minter} {}

    /// Split a run at ascending offsets into up to `offsets.size() + 1` runs.
    ///
    /// Each segment inherits the run's format. Segment `primary` keeps the
    /// run (and with it the run's address) and receives `style` if given;
    /// every other non-empty segment becomes a new run with a fresh address.
    /// Empty segments are not materialized.
    /// @return One entry per segment: the run holding it, or nullopt if empty.
    auto split_at_offsets(RunId run, std::vector<std::size_t> offsets,
                          std::size_t primary, const StyleUpdate* style)
        -> std::vector<std::optional<RunId>>;

    /// Apply character fields to every run and paragraph fields to every
    /// paragraph. No addressing changes.
    auto update_document_style(const StyleUpdate& style) -> EditOutcome;

    /// Restyle `[start, end)` inside a single run.
    auto update_node_style(const Address& address, std::size_t start, std::size_t end,
                           const StyleUpdate& style) -> EditOutcome;

    /// Restyle a range that may span runs and paragraphs. Paragraph fields
    /// apply to every paragraph owning a run in the range.
    auto update_range_style(const TextRange& range, const StyleUpdate& style) -> EditOutcome;

    /// Insert text at a caret. The inserted segment takes over the address.
    auto insert_text(const Caret& caret, std::string_view text,
                     const std::optional<StyleUpdate>& style) -> EditOutcome;

    /// Delete a range. Boundary runs are truncated in place; runs (and
    /// paragraphs) strictly between them are removed.
    auto delete_range(const TextRange& range) -> EditOutcome;

    /// Delete `count` characters before the caret, merging paragraphs when
    /// the caret crosses a paragraph start.
    auto delete_backward(const Caret& caret, std::size_t count = 1) -> EditOutcome;

    /// Delete `count` characters after the caret, merging the next
    /// paragraph in when the caret crosses a paragraph end.
    auto delete_forward(const Caret& caret, std::size_t count = 1) -> EditOutcome;

    /// Split the caret's paragraph in two. Text from the caret onward moves
    /// into a new paragraph and keeps the caret's address.
    auto insert_break(const Caret& caret) -> EditOutcome;

private:
    struct Step {
        Caret caret;
        bool merged{false};
        bool stuck{false};  ///< Nothing left to delete in this direction.
    };

    auto step_backward(const Caret& caret) -> Step;
    auto step_forward(const Caret& caret) -> Step;
    auto address_for(RunId run) -> Address;
    void restyle_paragraphs(RunId first, RunId last, const StyleUpdate& style);

    Document& doc_;
    AddressMinter& minter_;
};

}  // namespace docspan_cpp
