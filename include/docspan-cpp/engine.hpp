/// @file engine.hpp
/// @brief The document engine seam: load, serialize, paginate and render.

#pragma once

#include <docspan-cpp/document.hpp>
#include <docspan-cpp/types.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace docspan_cpp {

/// Tuning knobs of the bundled NativeEngine.
struct EngineOptions {
    std::size_t paragraphs_per_page{40};        ///< Pagination unit.
    std::size_t parallel_render_threshold{64};  ///< Paragraph count from which rendering fans out.

    auto operator==(const EngineOptions&) const -> bool = default;
};

/// Everything the editing core needs from a rich-text engine.
///
/// The core never parses, lays out or serializes documents itself; it calls
/// through this interface. Implementations must be safe to call from
/// several threads at once on distinct or const documents.
class DocumentEngine {
public:
    virtual ~DocumentEngine() = default;

    /// The document a fresh session starts with (unaddressed).
    virtual auto default_document() const -> Document = 0;

    /// Serialize a whole document, addresses included.
    virtual auto serialize(const Document& doc) const -> std::vector<std::byte> = 0;

    /// Parse a document. Addresses embedded in the bytes are kept.
    /// @return The document, or nullopt if the bytes are not a document.
    virtual auto load(std::span<const std::byte> bytes) const -> std::optional<Document> = 0;

    /// Number of pages, at least 1.
    virtual auto page_count(const Document& doc) const -> std::size_t = 0;

    /// Render the whole document, or one 1-based page, as HTML.
    /// @return The markup, or nullopt if rendering failed.
    virtual auto render_html(const Document& doc, std::optional<std::size_t> page) const
        -> std::optional<std::string> = 0;

    /// Render a single paragraph with the same markup as render_html().
    /// @return The fragment, or nullopt if the paragraph does not exist.
    virtual auto render_paragraph(const Document& doc, ParagraphId paragraph) const
        -> std::optional<std::string> = 0;
};

/// The bundled engine.
///
/// Native format is a JSON object (`"format": "docspan"`, `"version": 1`)
/// listing paragraphs and their runs, each run carrying its address. Plain
/// UTF-8 text is also accepted by load(): every line becomes a paragraph
/// with a single default-formatted run.
///
/// Markup: every paragraph is a `<p data-paragraph="ID">` with alignment and
/// indent as inline CSS; every run is a `<span>` with its character format,
/// wrapping an `<a name="ADDRESS">` so clients can map DOM nodes back to
/// addresses.
class NativeEngine final : public DocumentEngine {
public:
    explicit NativeEngine(EngineOptions options = {});

    auto default_document() const -> Document override;
    auto serialize(const Document& doc) const -> std::vector<std::byte> override;
    auto load(std::span<const std::byte> bytes) const -> std::optional<Document> override;
    auto page_count(const Document& doc) const -> std::size_t override;
    auto render_html(const Document& doc, std::optional<std::size_t> page) const
        -> std::optional<std::string> override;
    auto render_paragraph(const Document& doc, ParagraphId paragraph) const
        -> std::optional<std::string> override;

    auto options() const -> const EngineOptions& { return options_; }

private:
    EngineOptions options_;
};

/// Escape `& < > " '` for HTML text and attribute values.
auto escape_html(std::string_view text) -> std::string;

}  // namespace docspan_cpp
