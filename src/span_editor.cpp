#include <docspan-cpp/span_editor.hpp>

#include "encoding/utf8.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>
#include <utility>

namespace docspan_cpp {

namespace {

auto collapsed(Address address, std::size_t offset) -> Selection {
    return Selection{.anchor = Caret{std::move(address), offset}, .focus = std::nullopt};
}

auto unresolved(const Caret& caret) -> EditOutcome {
    return EditOutcome{.resolved = false, .structural = false,
                       .selection = collapsed(caret.address, caret.offset), .touched = {}};
}

}  // anonymous namespace

auto SpanEditor::address_for(RunId run) -> Address {
    if (auto existing = doc_.addresses().address_of(run)) return *existing;
    auto fresh = minter_.mint();
    doc_.addresses().bind(run, fresh);
    return fresh;
}

// -- Core primitive -----------------------------------------------------------

auto SpanEditor::split_at_offsets(RunId run, std::vector<std::size_t> offsets,
                                  std::size_t primary, const StyleUpdate* style)
    -> std::vector<std::optional<RunId>> {
    const auto* source = doc_.run(run);
    if (!source) return {};

    const auto text = source->text;
    const auto format = source->format;
    const auto len = encoding::utf8_length(text);
    for (auto& o : offsets) o = std::min(o, len);
    std::ranges::sort(offsets);

    const auto count = offsets.size() + 1;
    primary = std::min(primary, count - 1);

    auto segment = [&](std::size_t i) {
        auto begin = i == 0 ? std::size_t{0} : offsets[i - 1];
        auto end = i < offsets.size() ? offsets[i] : len;
        return encoding::utf8_substr(text, begin, end);
    };

    auto result = std::vector<std::optional<RunId>>(count);

    // Segments before the primary one go in front of the run, in order.
    for (std::size_t i = 0; i < primary; ++i) {
        auto piece = segment(i);
        if (piece.empty()) continue;
        auto id = doc_.insert_run_before(run, std::move(piece), format);
        doc_.addresses().bind(id, minter_.mint());
        result[i] = id;
    }

    // Segments after it are chained behind the run.
    auto anchor = run;
    for (std::size_t i = primary + 1; i < count; ++i) {
        auto piece = segment(i);
        if (piece.empty()) continue;
        auto id = doc_.insert_run_after(anchor, std::move(piece), format);
        doc_.addresses().bind(id, minter_.mint());
        result[i] = id;
        anchor = id;
    }

    auto kept = segment(primary);
    if (kept.empty()) {
        doc_.remove_run(run);
        return result;
    }
    auto* target = doc_.run(run);
    target->text = std::move(kept);
    if (style) apply_style(target->format, *style);
    result[primary] = run;
    return result;
}

// -- Style --------------------------------------------------------------------

auto SpanEditor::update_document_style(const StyleUpdate& style) -> EditOutcome {
    for (auto rid : doc_.runs_in_order()) {
        apply_style(doc_.run(rid)->format, style);
    }
    auto ids = std::vector<ParagraphId>{};
    std::ranges::transform(doc_.paragraphs(), std::back_inserter(ids), &Paragraph::id);
    for (auto pid : ids) {
        apply_style(doc_.paragraph(pid)->format, style);
    }
    return EditOutcome{};
}

auto SpanEditor::update_node_style(const Address& address, std::size_t start, std::size_t end,
                                   const StyleUpdate& style) -> EditOutcome {
    return update_range_style(TextRange{Caret{address, start}, Caret{address, end}}, style);
}

void SpanEditor::restyle_paragraphs(RunId first, RunId last, const StyleUpdate& style) {
    if (!style.has_paragraph_fields()) return;

    auto visited = std::vector<ParagraphId>{};
    for (auto cur = std::optional<RunId>{first}; cur; cur = doc_.next_run(*cur)) {
        auto pid = doc_.run(*cur)->paragraph;
        if (std::ranges::find(visited, pid) == visited.end()) visited.push_back(pid);
        if (*cur == last) break;
    }
    for (auto pid : visited) {
        apply_style(doc_.paragraph(pid)->format, style);
    }
}

auto SpanEditor::update_range_style(const TextRange& range, const StyleUpdate& style) -> EditOutcome {
    auto start_id = doc_.addresses().resolve(range.start.address);
    auto end_id = doc_.addresses().resolve(range.end.address);
    if (!start_id || !end_id) return unresolved(range.start);

    auto start = range.start;
    auto end = range.end;
    auto s = *start_id;
    auto e = *end_id;
    if (doc_.precedes(e, s)) {
        std::swap(start, end);
        std::swap(s, e);
    }

    auto outcome = EditOutcome{};
    outcome.touched = {start.address, end.address};

    if (s == e) {
        const auto len = doc_.run_length(s);
        const auto a = std::min(start.offset, len);
        const auto b = std::min(end.offset, len);
        if (a >= b) {
            outcome.selection = collapsed(start.address, a);
            return outcome;
        }
        if (a == 0 && b == len) {
            apply_style(doc_.run(s)->format, style);
        } else {
            split_at_offsets(s, {a, b}, 1, &style);
        }
        restyle_paragraphs(s, s, style);
        outcome.selection = Selection{.anchor = Caret{start.address, 0},
                                      .focus = Caret{start.address, b - a}};
        return outcome;
    }

    const auto start_len = doc_.run_length(s);
    const auto end_len = doc_.run_length(e);
    const auto a = std::min(start.offset, start_len);
    const auto b = std::min(end.offset, end_len);

    auto anchor = Caret{start.address, a};
    if (a == start_len) {
        // Nothing of the start run is selected.
    } else if (a == 0) {
        apply_style(doc_.run(s)->format, style);
    } else {
        split_at_offsets(s, {a}, 1, &style);
        anchor.offset = 0;
    }

    auto focus = Caret{end.address, b};
    if (b == 0) {
        // Nothing of the end run is selected.
    } else if (b == end_len) {
        apply_style(doc_.run(e)->format, style);
    } else {
        split_at_offsets(e, {b}, 0, &style);
    }

    for (auto cur = doc_.next_run(s); cur && *cur != e; cur = doc_.next_run(*cur)) {
        apply_style(doc_.run(*cur)->format, style);
    }
    restyle_paragraphs(s, e, style);

    outcome.selection = Selection{.anchor = std::move(anchor), .focus = std::move(focus)};
    return outcome;
}

// -- Text ---------------------------------------------------------------------

auto SpanEditor::insert_text(const Caret& caret, std::string_view text,
                             const std::optional<StyleUpdate>& style) -> EditOutcome {
    auto id = doc_.addresses().resolve(caret.address);
    if (!id) return unresolved(caret);

    auto* r = doc_.run(*id);
    const auto len = encoding::utf8_length(r->text);
    const auto offset = std::min(caret.offset, len);

    auto outcome = EditOutcome{};
    outcome.touched = {caret.address};
    if (text.empty()) {
        outcome.selection = collapsed(caret.address, offset);
        return outcome;
    }

    const auto inserted = encoding::utf8_length(text);
    if (len == 0) {
        r->text = std::string{text};
        if (style) apply_style(r->format, *style);
    } else {
        r->text.insert(encoding::utf8_byte_offset(r->text, offset), text);
        split_at_offsets(*id, {offset, offset + inserted}, 1, style ? &*style : nullptr);
    }

    // The inserted segment owns the address, so the caret sits at its end.
    outcome.selection = collapsed(caret.address, inserted);
    return outcome;
}

auto SpanEditor::delete_range(const TextRange& range) -> EditOutcome {
    auto start_id = doc_.addresses().resolve(range.start.address);
    auto end_id = doc_.addresses().resolve(range.end.address);
    if (!start_id || !end_id) return unresolved(range.start);

    auto start = range.start;
    auto end = range.end;
    auto s = *start_id;
    auto e = *end_id;
    if (doc_.precedes(e, s)) {
        std::swap(start, end);
        std::swap(s, e);
    }

    auto outcome = EditOutcome{};
    outcome.touched = {start.address, end.address};

    if (s == e) {
        auto* r = doc_.run(s);
        const auto len = encoding::utf8_length(r->text);
        const auto a = std::min(start.offset, len);
        const auto b = std::min(end.offset, len);
        if (a < b) encoding::utf8_erase(r->text, a, b);
        outcome.selection = collapsed(start.address, std::min(a, b));
        return outcome;
    }

    const auto a = std::min(start.offset, doc_.run_length(s));
    const auto b = std::min(end.offset, doc_.run_length(e));

    auto between = std::vector<RunId>{};
    for (auto cur = doc_.next_run(s); cur && *cur != e; cur = doc_.next_run(*cur)) {
        between.push_back(*cur);
    }

    auto* first = doc_.run(s);
    first->text = encoding::utf8_substr(first->text, 0, a);
    encoding::utf8_erase(doc_.run(e)->text, 0, b);
    for (auto rid : between) doc_.remove_run(rid);

    // Paragraphs lying wholly inside the range are gone with their runs.
    const auto first_index = *doc_.paragraph_index(doc_.run(s)->paragraph);
    const auto last_index = *doc_.paragraph_index(doc_.run(e)->paragraph);
    auto doomed = std::vector<ParagraphId>{};
    for (auto i = first_index + 1; i < last_index; ++i) {
        doomed.push_back(doc_.paragraphs()[i].id);
    }
    for (auto pid : doomed) doc_.remove_paragraph(pid);

    outcome.structural = !doomed.empty();
    outcome.selection = collapsed(start.address, a);
    return outcome;
}

auto SpanEditor::step_backward(const Caret& caret) -> Step {
    auto id = doc_.addresses().resolve(caret.address);
    if (!id) return Step{caret, false, true};

    auto* r = doc_.run(*id);
    const auto offset = std::min(caret.offset, encoding::utf8_length(r->text));
    if (offset > 0) {
        encoding::utf8_erase(r->text, offset - 1, offset);
        return Step{Caret{caret.address, offset - 1}};
    }

    // At the run start: eat the last character of the nearest non-empty
    // run before it in the same paragraph.
    const auto* p = doc_.paragraph(r->paragraph);
    for (auto i = *doc_.run_index(*id); i > 0; --i) {
        auto prev = p->runs[i - 1];
        auto prev_len = doc_.run_length(prev);
        if (prev_len == 0) continue;
        encoding::utf8_erase(doc_.run(prev)->text, prev_len - 1, prev_len);
        return Step{Caret{address_for(prev), prev_len - 1}};
    }

    // At the paragraph start: the paragraph break goes.
    const auto index = *doc_.paragraph_index(p->id);
    if (index == 0) return Step{Caret{caret.address, 0}, false, true};

    const auto& before = doc_.paragraphs()[index - 1];
    const auto into = before.id;
    const auto from = p->id;
    auto landing = Caret{caret.address, 0};
    if (!before.runs.empty()) {
        auto last = before.runs.back();
        landing = Caret{address_for(last), doc_.run_length(last)};
    }
    doc_.merge_paragraphs(into, from);
    return Step{std::move(landing), true};
}

auto SpanEditor::step_forward(const Caret& caret) -> Step {
    auto id = doc_.addresses().resolve(caret.address);
    if (!id) return Step{caret, false, true};

    auto* r = doc_.run(*id);
    const auto len = encoding::utf8_length(r->text);
    const auto offset = std::min(caret.offset, len);
    const auto here = Caret{caret.address, offset};
    if (offset < len) {
        encoding::utf8_erase(r->text, offset, offset + 1);
        return Step{here};
    }

    const auto* p = doc_.paragraph(r->paragraph);
    for (auto i = *doc_.run_index(*id) + 1; i < p->runs.size(); ++i) {
        auto next = p->runs[i];
        if (doc_.run_length(next) == 0) continue;
        encoding::utf8_erase(doc_.run(next)->text, 0, 1);
        return Step{here};
    }

    const auto index = *doc_.paragraph_index(p->id);
    if (index + 1 >= doc_.paragraph_count()) return Step{here, false, true};

    doc_.merge_paragraphs(p->id, doc_.paragraphs()[index + 1].id);
    return Step{here, true};
}

auto SpanEditor::delete_backward(const Caret& caret, std::size_t count) -> EditOutcome {
    if (!doc_.addresses().contains(caret.address)) return unresolved(caret);

    auto outcome = EditOutcome{};
    auto current = caret;
    for (std::size_t i = 0; i < std::max<std::size_t>(count, 1); ++i) {
        auto step = step_backward(current);
        outcome.structural = outcome.structural || step.merged;
        current = std::move(step.caret);
        if (step.stuck) break;
    }

    outcome.touched = {caret.address};
    if (current.address != caret.address) outcome.touched.push_back(current.address);
    outcome.selection = collapsed(current.address, current.offset);
    return outcome;
}

auto SpanEditor::delete_forward(const Caret& caret, std::size_t count) -> EditOutcome {
    if (!doc_.addresses().contains(caret.address)) return unresolved(caret);

    auto outcome = EditOutcome{};
    auto current = caret;
    for (std::size_t i = 0; i < std::max<std::size_t>(count, 1); ++i) {
        auto step = step_forward(current);
        outcome.structural = outcome.structural || step.merged;
        current = std::move(step.caret);
        if (step.stuck) break;
    }

    outcome.touched = {caret.address};
    outcome.selection = collapsed(current.address, current.offset);
    return outcome;
}

auto SpanEditor::insert_break(const Caret& caret) -> EditOutcome {
    auto id = doc_.addresses().resolve(caret.address);
    if (!id) return unresolved(caret);

    const auto* r = doc_.run(*id);
    const auto len = encoding::utf8_length(r->text);
    const auto offset = std::min(caret.offset, len);
    const auto original = r->paragraph;
    const auto format = r->format;
    auto pre = encoding::utf8_substr(r->text, 0, offset);
    auto post = encoding::utf8_substr(r->text, offset, len);

    // The run itself (and its address) moves into the new paragraph.
    doc_.split_paragraph_at(*id);
    doc_.run(*id)->text = std::move(post);
    if (!pre.empty()) {
        auto pre_id = doc_.append_run(original, std::move(pre), format);
        doc_.addresses().bind(pre_id, minter_.mint());
    }

    auto outcome = EditOutcome{};
    outcome.structural = true;
    outcome.touched = {caret.address};
    outcome.selection = collapsed(caret.address, 0);
    return outcome;
}

}  // namespace docspan_cpp
