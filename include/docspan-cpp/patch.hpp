/// @file patch.hpp
/// @brief Paragraph-level re-render fragments.

#pragma once

#include <docspan-cpp/document.hpp>
#include <docspan-cpp/engine.hpp>
#include <docspan-cpp/types.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docspan_cpp {

/// A re-rendered paragraph a client can swap into its view.
struct ParagraphPatch {
    ParagraphId paragraph_id{0};      ///< Matches `data-paragraph` in the markup.
    std::size_t paragraph_index{0};   ///< Position in the document.
    std::string html;                 ///< The paragraph's fresh markup.

    auto operator==(const ParagraphPatch&) const -> bool = default;
};

/// Builds single-paragraph patches from the addresses an edit touched.
///
/// Every method returns nullopt when a patch cannot be built; callers then
/// fall back to rendering the whole page.
class PatchExtractor {
public:
    explicit PatchExtractor(const DocumentEngine& engine) : engine_{engine} {}

    /// The paragraph containing `address`.
    auto paragraph_patch(const Document& doc, std::string_view address) const
        -> std::optional<ParagraphPatch>;

    /// The paragraph containing both addresses; nullopt if they resolve into
    /// different paragraphs.
    auto range_patch(const Document& doc, std::string_view start, std::string_view end) const
        -> std::optional<ParagraphPatch>;

    /// The single paragraph containing every touched address.
    auto touched_patch(const Document& doc, const std::vector<Address>& touched) const
        -> std::optional<ParagraphPatch>;

private:
    auto render(const Document& doc, ParagraphId paragraph) const -> std::optional<ParagraphPatch>;

    const DocumentEngine& engine_;
};

}  // namespace docspan_cpp
