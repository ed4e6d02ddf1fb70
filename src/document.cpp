#include <docspan-cpp/document.hpp>

#include "encoding/utf8.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <ranges>

namespace docspan_cpp {

auto Document::run(RunId id) -> Run* {
    auto it = runs_.find(id);
    return it != runs_.end() ? &it->second : nullptr;
}

auto Document::run(RunId id) const -> const Run* {
    auto it = runs_.find(id);
    return it != runs_.end() ? &it->second : nullptr;
}

auto Document::find_paragraph(ParagraphId id) -> std::vector<Paragraph>::iterator {
    return std::ranges::find(paragraphs_, id, &Paragraph::id);
}

auto Document::find_paragraph(ParagraphId id) const -> std::vector<Paragraph>::const_iterator {
    return std::ranges::find(paragraphs_, id, &Paragraph::id);
}

auto Document::paragraph(ParagraphId id) -> Paragraph* {
    auto it = find_paragraph(id);
    return it != paragraphs_.end() ? &*it : nullptr;
}

auto Document::paragraph(ParagraphId id) const -> const Paragraph* {
    auto it = find_paragraph(id);
    return it != paragraphs_.end() ? &*it : nullptr;
}

auto Document::paragraph_index(ParagraphId id) const -> std::optional<std::size_t> {
    auto it = find_paragraph(id);
    if (it == paragraphs_.end()) return std::nullopt;
    return static_cast<std::size_t>(std::distance(paragraphs_.begin(), it));
}

auto Document::run_index(RunId id) const -> std::optional<std::size_t> {
    const auto* r = run(id);
    if (!r) return std::nullopt;
    const auto* p = paragraph(r->paragraph);
    if (!p) return std::nullopt;
    auto it = std::ranges::find(p->runs, id);
    if (it == p->runs.end()) return std::nullopt;
    return static_cast<std::size_t>(std::distance(p->runs.begin(), it));
}

auto Document::run_length(RunId id) const -> std::size_t {
    const auto* r = run(id);
    return r ? encoding::utf8_length(r->text) : 0;
}

auto Document::runs_in_order() const -> std::vector<RunId> {
    auto result = std::vector<RunId>{};
    result.reserve(runs_.size());
    for (const auto& p : paragraphs_) {
        result.insert(result.end(), p.runs.begin(), p.runs.end());
    }
    return result;
}

auto Document::next_run(RunId id) const -> std::optional<RunId> {
    const auto* r = run(id);
    if (!r) return std::nullopt;
    auto p_it = find_paragraph(r->paragraph);
    if (p_it == paragraphs_.end()) return std::nullopt;

    auto r_it = std::ranges::find(p_it->runs, id);
    if (r_it != p_it->runs.end() && std::next(r_it) != p_it->runs.end()) {
        return *std::next(r_it);
    }
    for (auto it = std::next(p_it); it != paragraphs_.end(); ++it) {
        if (!it->runs.empty()) return it->runs.front();
    }
    return std::nullopt;
}

auto Document::prev_run(RunId id) const -> std::optional<RunId> {
    const auto* r = run(id);
    if (!r) return std::nullopt;
    auto p_it = find_paragraph(r->paragraph);
    if (p_it == paragraphs_.end()) return std::nullopt;

    auto r_it = std::ranges::find(p_it->runs, id);
    if (r_it != p_it->runs.begin() && r_it != p_it->runs.end()) {
        return *std::prev(r_it);
    }
    for (auto it = std::make_reverse_iterator(p_it); it != paragraphs_.rend(); ++it) {
        if (!it->runs.empty()) return it->runs.back();
    }
    return std::nullopt;
}

auto Document::precedes(RunId a, RunId b) const -> bool {
    if (a == b) return false;
    const auto* ra = run(a);
    const auto* rb = run(b);
    if (!ra || !rb) return false;
    auto pa = paragraph_index(ra->paragraph);
    auto pb = paragraph_index(rb->paragraph);
    if (!pa || !pb) return false;
    if (*pa != *pb) return *pa < *pb;
    return run_index(a) < run_index(b);
}

auto Document::paragraph_text(ParagraphId id) const -> std::string {
    const auto* p = paragraph(id);
    if (!p) return {};
    auto result = std::string{};
    for (auto rid : p->runs) {
        if (const auto* r = run(rid)) result += r->text;
    }
    return result;
}

auto Document::text() const -> std::string {
    auto result = std::string{};
    for (std::size_t i = 0; i < paragraphs_.size(); ++i) {
        if (i > 0) result.push_back('\n');
        result += paragraph_text(paragraphs_[i].id);
    }
    return result;
}

auto Document::resolve(std::string_view address) -> Run* {
    auto id = addresses_.resolve(address);
    return id ? run(*id) : nullptr;
}

auto Document::resolve(std::string_view address) const -> const Run* {
    auto id = addresses_.resolve(address);
    return id ? run(*id) : nullptr;
}

void Document::address_unbound_runs(AddressMinter& minter) {
    for (auto rid : runs_in_order()) {
        if (!addresses_.address_of(rid)) addresses_.bind(rid, minter.mint());
    }
}

void Document::readdress_all_runs(AddressMinter& minter) {
    addresses_.clear();
    address_unbound_runs(minter);
}

// -- Structure ----------------------------------------------------------------

auto Document::append_paragraph(ParagraphFormat format) -> ParagraphId {
    auto id = next_paragraph_id_++;
    paragraphs_.push_back(Paragraph{.id = id, .format = format, .runs = {}});
    return id;
}

auto Document::append_paragraph_as(ParagraphId id, ParagraphFormat format) -> ParagraphId {
    if (id == 0 || id == std::numeric_limits<ParagraphId>::max() ||
        find_paragraph(id) != paragraphs_.end()) {
        return append_paragraph(format);
    }
    next_paragraph_id_ = std::max(next_paragraph_id_, id + 1);
    paragraphs_.push_back(Paragraph{.id = id, .format = format, .runs = {}});
    return id;
}

auto Document::insert_paragraph_after(ParagraphId after, ParagraphFormat format) -> ParagraphId {
    auto it = find_paragraph(after);
    auto id = next_paragraph_id_++;
    auto pos = it == paragraphs_.end() ? paragraphs_.end() : std::next(it);
    paragraphs_.insert(pos, Paragraph{.id = id, .format = format, .runs = {}});
    return id;
}

void Document::remove_paragraph(ParagraphId id) {
    auto it = find_paragraph(id);
    if (it == paragraphs_.end()) return;
    for (auto rid : it->runs) {
        addresses_.unbind_run(rid);
        runs_.erase(rid);
    }
    paragraphs_.erase(it);
}

auto Document::new_run(ParagraphId paragraph, std::string text, RunFormat format) -> RunId {
    auto id = next_run_id_++;
    runs_.emplace(id, Run{.id = id, .paragraph = paragraph,
                          .text = std::move(text), .format = std::move(format)});
    return id;
}

auto Document::append_run(ParagraphId paragraph_id, std::string text, RunFormat format) -> RunId {
    auto* p = paragraph(paragraph_id);
    if (!p) return 0;
    auto id = new_run(paragraph_id, std::move(text), std::move(format));
    p->runs.push_back(id);
    return id;
}

auto Document::insert_run_before(RunId anchor, std::string text, RunFormat format) -> RunId {
    const auto* a = run(anchor);
    if (!a) return 0;
    auto* p = paragraph(a->paragraph);
    auto id = new_run(a->paragraph, std::move(text), std::move(format));
    p->runs.insert(std::ranges::find(p->runs, anchor), id);
    return id;
}

auto Document::insert_run_after(RunId anchor, std::string text, RunFormat format) -> RunId {
    const auto* a = run(anchor);
    if (!a) return 0;
    auto* p = paragraph(a->paragraph);
    auto id = new_run(a->paragraph, std::move(text), std::move(format));
    p->runs.insert(std::next(std::ranges::find(p->runs, anchor)), id);
    return id;
}

void Document::remove_run(RunId id) {
    const auto* r = run(id);
    if (!r) return;
    if (auto* p = paragraph(r->paragraph)) {
        std::erase(p->runs, id);
    }
    addresses_.unbind_run(id);
    runs_.erase(id);
}

auto Document::split_paragraph_at(RunId first) -> ParagraphId {
    const auto* r = run(first);
    if (!r) return 0;
    auto source_id = r->paragraph;
    auto format = paragraph(source_id)->format;
    auto new_id = insert_paragraph_after(source_id, format);

    // insert_paragraph_after may reallocate; look both up again.
    auto* source = paragraph(source_id);
    auto* target = paragraph(new_id);
    auto split = std::ranges::find(source->runs, first);
    target->runs.assign(split, source->runs.end());
    source->runs.erase(split, source->runs.end());
    for (auto rid : target->runs) {
        runs_.at(rid).paragraph = new_id;
    }
    return new_id;
}

void Document::merge_paragraphs(ParagraphId into, ParagraphId from) {
    if (into == from) return;
    auto* target = paragraph(into);
    auto* source = paragraph(from);
    if (!target || !source) return;
    for (auto rid : source->runs) {
        runs_.at(rid).paragraph = into;
        target->runs.push_back(rid);
    }
    source->runs.clear();
    paragraphs_.erase(find_paragraph(from));
}

}  // namespace docspan_cpp
