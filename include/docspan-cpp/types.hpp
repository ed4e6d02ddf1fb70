/// @file types.hpp
/// @brief Core identity types: Address, RunId, ParagraphId, Caret, TextRange.

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace docspan_cpp {

/// An opaque stable identifier bound to at most one Run at a time.
///
/// Addresses are minted by an AddressMinter and look like
/// `Run_<32 hex digits>`, but callers must treat them as opaque strings.
/// An address is never reused for a different Run.
using Address = std::string;

/// Arena handle of a Run inside a Document. Not stable across snapshots.
using RunId = std::uint32_t;

/// Arena handle of a Paragraph inside a Document.
using ParagraphId = std::uint32_t;

/// A caret position: a code point offset inside the Run bound to an address.
struct Caret {
    Address address;         ///< The Run the caret lives in.
    std::size_t offset{0};   ///< Offset in Unicode code points.

    auto operator==(const Caret&) const -> bool = default;
};

/// A span of text from one caret to another, possibly across Runs.
struct TextRange {
    Caret start;  ///< Inclusive start.
    Caret end;    ///< Exclusive end.

    auto operator==(const TextRange&) const -> bool = default;
};

/// The selection reported back to a caller after an edit.
///
/// A collapsed selection (plain caret) has no focus.
struct Selection {
    Caret anchor;                 ///< Where the selection starts (or the caret).
    std::optional<Caret> focus;   ///< Where the selection ends, if not collapsed.

    auto operator==(const Selection&) const -> bool = default;
};

/// The identity of a document as seen by clients.
///
/// `doc_id` changes only when the whole document is replaced (init, upload);
/// `version` advances by exactly one per applied mutation.
struct DocIdentity {
    std::string doc_id;         ///< Opaque document identity.
    std::uint64_t version{0};   ///< Monotonic mutation counter.

    auto operator==(const DocIdentity&) const -> bool = default;
};

}  // namespace docspan_cpp
