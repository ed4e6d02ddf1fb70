/// @file document.hpp
/// @brief The Document model: an arena of Runs grouped into Paragraphs.

#pragma once

#include <docspan-cpp/address_index.hpp>
#include <docspan-cpp/style.hpp>
#include <docspan-cpp/types.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace docspan_cpp {

/// An atomic span of text with uniform character formatting.
struct Run {
    RunId id{0};               ///< Arena handle.
    ParagraphId paragraph{0};  ///< The owning paragraph.
    std::string text;          ///< UTF-8 text.
    RunFormat format;          ///< Uniform character formatting.

    auto operator==(const Run&) const -> bool = default;
};

/// An ordered container of Runs plus block-level formatting.
struct Paragraph {
    ParagraphId id{0};          ///< Arena handle.
    ParagraphFormat format;     ///< Alignment and indent.
    std::vector<RunId> runs;    ///< Runs in reading order.

    auto operator==(const Paragraph&) const -> bool = default;
};

/// A rich-text document: ordered Paragraphs owning ordered Runs.
///
/// Runs live in an arena keyed by RunId; Paragraphs hold run handles in
/// reading order. The AddressIndex binding stable addresses to runs is part
/// of the document, so copying a Document (or serializing it) carries the
/// addressing along. Removing a run always drops its binding.
///
/// Document is a plain value type with no locking; Session provides the
/// synchronization.
///
/// @code
/// auto doc = Document{};
/// auto p = doc.append_paragraph();
/// auto r = doc.append_run(p, "Hello", RunFormat{});
/// doc.addresses().bind(r, "Run_hello");
/// @endcode
class Document {
public:
    // -- Reading ----------------------------------------------------------------

    /// All paragraphs in reading order.
    auto paragraphs() const -> const std::vector<Paragraph>& { return paragraphs_; }

    /// Number of paragraphs.
    auto paragraph_count() const -> std::size_t { return paragraphs_.size(); }

    /// Number of runs across all paragraphs.
    auto run_count() const -> std::size_t { return runs_.size(); }

    /// Get a run by handle, or nullptr if it does not exist.
    auto run(RunId id) -> Run*;
    auto run(RunId id) const -> const Run*;

    /// Get a paragraph by handle, or nullptr if it does not exist.
    auto paragraph(ParagraphId id) -> Paragraph*;
    auto paragraph(ParagraphId id) const -> const Paragraph*;

    /// Position of a paragraph in reading order.
    auto paragraph_index(ParagraphId id) const -> std::optional<std::size_t>;

    /// Position of a run inside its paragraph.
    auto run_index(RunId id) const -> std::optional<std::size_t>;

    /// Length of a run's text in code points (0 for unknown runs).
    auto run_length(RunId id) const -> std::size_t;

    /// Every run handle in reading order.
    auto runs_in_order() const -> std::vector<RunId>;

    /// The run following `id` in reading order, crossing paragraphs.
    auto next_run(RunId id) const -> std::optional<RunId>;

    /// The run preceding `id` in reading order, crossing paragraphs.
    auto prev_run(RunId id) const -> std::optional<RunId>;

    /// True if run `a` comes strictly before run `b` in reading order.
    auto precedes(RunId a, RunId b) const -> bool;

    /// Plain text of one paragraph.
    auto paragraph_text(ParagraphId id) const -> std::string;

    /// Plain text of the whole document, paragraphs joined with '\n'.
    auto text() const -> std::string;

    // -- Addressing -------------------------------------------------------------

    /// The address index of this document.
    auto addresses() -> AddressIndex& { return addresses_; }
    auto addresses() const -> const AddressIndex& { return addresses_; }

    /// Bind a freshly minted address to every run that has none.
    void address_unbound_runs(AddressMinter& minter);

    /// Strip every binding, then give every run a freshly minted address.
    void readdress_all_runs(AddressMinter& minter);

    /// Resolve an address straight to its run.
    auto resolve(std::string_view address) -> Run*;
    auto resolve(std::string_view address) const -> const Run*;

    // -- Structure ----------------------------------------------------------------

    /// Append a new, empty paragraph at the end of the document.
    auto append_paragraph(ParagraphFormat format = {}) -> ParagraphId;

    /// Append a paragraph that keeps `id` when it is non-zero and unused, and
    /// takes a fresh id otherwise. Later fresh ids are allocated past `id`.
    auto append_paragraph_as(ParagraphId id, ParagraphFormat format) -> ParagraphId;

    /// Insert a new, empty paragraph immediately after `after`.
    auto insert_paragraph_after(ParagraphId after, ParagraphFormat format) -> ParagraphId;

    /// Remove a paragraph together with its runs and their bindings.
    void remove_paragraph(ParagraphId id);

    /// Append a run at the end of a paragraph.
    auto append_run(ParagraphId paragraph, std::string text, RunFormat format) -> RunId;

    /// Insert a run immediately before `anchor`, in the same paragraph.
    auto insert_run_before(RunId anchor, std::string text, RunFormat format) -> RunId;

    /// Insert a run immediately after `anchor`, in the same paragraph.
    auto insert_run_after(RunId anchor, std::string text, RunFormat format) -> RunId;

    /// Remove a run and its binding.
    void remove_run(RunId id);

    /// Split the paragraph owning `first` in two: `first` and every run after
    /// it move into a new paragraph inserted right after, with the same
    /// paragraph format.
    /// @return The new paragraph.
    auto split_paragraph_at(RunId first) -> ParagraphId;

    /// Reparent every run of `from` to the end of `into`, then discard `from`.
    void merge_paragraphs(ParagraphId into, ParagraphId from);

    auto operator==(const Document&) const -> bool = default;

private:
    auto new_run(ParagraphId paragraph, std::string text, RunFormat format) -> RunId;
    auto find_paragraph(ParagraphId id) -> std::vector<Paragraph>::iterator;
    auto find_paragraph(ParagraphId id) const -> std::vector<Paragraph>::const_iterator;

    std::vector<Paragraph> paragraphs_;
    std::unordered_map<RunId, Run> runs_;
    AddressIndex addresses_;
    RunId next_run_id_{1};
    ParagraphId next_paragraph_id_{1};
};

}  // namespace docspan_cpp
