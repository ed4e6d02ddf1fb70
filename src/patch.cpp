#include <docspan-cpp/patch.hpp>

#include <utility>

namespace docspan_cpp {

auto PatchExtractor::render(const Document& doc, ParagraphId paragraph) const
    -> std::optional<ParagraphPatch> {
    auto index = doc.paragraph_index(paragraph);
    if (!index) return std::nullopt;
    auto html = engine_.render_paragraph(doc, paragraph);
    if (!html) return std::nullopt;
    return ParagraphPatch{.paragraph_id = paragraph, .paragraph_index = *index, .html = std::move(*html)};
}

auto PatchExtractor::paragraph_patch(const Document& doc, std::string_view address) const
    -> std::optional<ParagraphPatch> {
    const auto* run = doc.resolve(address);
    if (!run) return std::nullopt;
    return render(doc, run->paragraph);
}

auto PatchExtractor::range_patch(const Document& doc, std::string_view start,
                                 std::string_view end) const -> std::optional<ParagraphPatch> {
    const auto* a = doc.resolve(start);
    const auto* b = doc.resolve(end);
    if (!a || !b || a->paragraph != b->paragraph) return std::nullopt;
    return render(doc, a->paragraph);
}

auto PatchExtractor::touched_patch(const Document& doc, const std::vector<Address>& touched) const
    -> std::optional<ParagraphPatch> {
    if (touched.empty()) return std::nullopt;
    const auto* first = doc.resolve(touched.front());
    if (!first) return std::nullopt;
    for (const auto& address : touched) {
        const auto* run = doc.resolve(address);
        if (!run || run->paragraph != first->paragraph) return std::nullopt;
    }
    return render(doc, first->paragraph);
}

}  // namespace docspan_cpp
